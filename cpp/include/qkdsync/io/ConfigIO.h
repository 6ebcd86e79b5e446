#pragma once

#include "qkdsync/core/SimulationConfig.h"
#include <QJsonObject>
#include <QString>
#include <optional>

namespace qkdsync::io {

/**
 * JSON layout:
 * {
 *   "source":     { "signal_power", "decoy_power", "signal_probability",
 *                   "block_size" },
 *   "channel":    { "loss_probability" | "loss_db", "dark_count_rate",
 *                   "time_bin_width", "sync_offset_true", "sync_jitter_std" },
 *   "processing": { "max_offset", "sync_threshold_sigma" },
 *   "seed": "<uint64 as string or number>"
 * }
 * Missing keys keep their defaults. Only types are checked here; ranges are
 * enforced by the pipeline stages.
 */
QJsonObject toJson(const core::SimulationConfig &config);

/// nullopt (with *error filled) on a wrongly typed or conflicting key.
std::optional<core::SimulationConfig> fromJson(const QJsonObject &root,
                                               QString *error = nullptr);

std::optional<core::SimulationConfig> loadConfig(const QString &path,
                                                 QString *error = nullptr);

bool saveConfig(const core::SimulationConfig &config, const QString &path,
                QString *error = nullptr);

} // namespace qkdsync::io
