#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QVector>

#include <optional>

namespace nr {

struct ArmSelection {
    int armId = 0;
    double decisionValue = 0.0;
    SelectionReason reason = SelectionReason::Exploitation;
};

// Strategy that picks one arm for a request context. nullopt means the
// selector could not decide; the engine then serves its fallback arm.
class ArmSelector {
public:
    virtual ~ArmSelector() = default;

    virtual std::optional<ArmSelection> selectArm(const BanditContext& context,
                                                  const QVector<BanditArm>& arms) = 0;
    virtual QString name() const = 0;
};

} // namespace nr
