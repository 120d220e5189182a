#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(nrCore, "newsrank.core")
Q_LOGGING_CATEGORY(nrRanking, "newsrank.ranking")
Q_LOGGING_CATEGORY(nrExperiment, "newsrank.experiment")
Q_LOGGING_CATEGORY(nrBandit, "newsrank.bandit")
Q_LOGGING_CATEGORY(nrMetrics, "newsrank.metrics")
Q_LOGGING_CATEGORY(nrStore, "newsrank.store")
Q_LOGGING_CATEGORY(nrIpc, "newsrank.ipc")
