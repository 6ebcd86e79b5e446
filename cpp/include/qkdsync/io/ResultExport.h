#pragma once

#include "qkdsync/data/SimulationResult.h"
#include <QJsonObject>
#include <QString>

namespace qkdsync::io {

/// offset,time_s,correlation (one row per evaluated offset).
bool exportCorrelationCsv(const data::SimulationResult &result,
                          const QString &path, QString *error = nullptr);

/// bin,time_s,counts (one row per detected histogram bin).
bool exportCountsCsv(const data::SimulationResult &result,
                     const QString &path, QString *error = nullptr);

/// Series, peak, statistics, metrics, seed and configuration of one run.
QJsonObject resultToJson(const data::SimulationResult &result);

bool exportResultJson(const data::SimulationResult &result,
                      const QString &path, QString *error = nullptr);

} // namespace qkdsync::io
