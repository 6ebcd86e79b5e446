#include "qkdsync/io/ConfigIO.h"
#include "qkdsync/core/Error.h"
#include "qkdsync/sim/ChannelModel.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>
#include <limits>

namespace qkdsync::io {

namespace {

void setError(QString *error, const QString &msg) {
  if (error)
    *error = msg;
}

// Each reader leaves *out untouched when the key is absent.
bool readDouble(const QJsonObject &obj, const char *key, double *out,
                const QString &group, QString *error) {
  const auto v = obj.value(key);
  if (v.isUndefined())
    return true;
  if (!v.isDouble()) {
    setError(error, QString("%1.%2 must be a number")
                        .arg(group, QLatin1String(key)));
    return false;
  }
  *out = v.toDouble();
  return true;
}

bool readInt(const QJsonObject &obj, const char *key, int *out,
             const QString &group, QString *error) {
  const auto v = obj.value(key);
  if (v.isUndefined())
    return true;
  const double d = v.toDouble(std::numeric_limits<double>::quiet_NaN());
  if (!v.isDouble() || std::floor(d) != d ||
      d < std::numeric_limits<int>::min() ||
      d > std::numeric_limits<int>::max()) {
    setError(error, QString("%1.%2 must be an integer")
                        .arg(group, QLatin1String(key)));
    return false;
  }
  *out = static_cast<int>(d);
  return true;
}

bool readGroup(const QJsonObject &root, const char *name, QJsonObject *out,
               QString *error) {
  const auto v = root.value(name);
  if (v.isUndefined())
    return true;
  if (!v.isObject()) {
    setError(error, QString("%1 must be an object").arg(name));
    return false;
  }
  *out = v.toObject();
  return true;
}

} // namespace

QJsonObject toJson(const core::SimulationConfig &config) {
  QJsonObject source;
  source["signal_power"] = config.source.signalPower;
  source["decoy_power"] = config.source.decoyPower;
  source["signal_probability"] = config.source.signalProbability;
  source["block_size"] = config.source.blockSize;

  QJsonObject channel;
  channel["loss_probability"] = config.channel.lossProbability;
  channel["dark_count_rate"] = config.channel.darkCountRate;
  channel["time_bin_width"] = config.channel.timeBinWidth;
  channel["sync_offset_true"] = config.channel.syncOffsetTrue;
  channel["sync_jitter_std"] = config.channel.syncJitterStd;

  QJsonObject processing;
  processing["max_offset"] = config.processing.maxOffset;
  processing["sync_threshold_sigma"] = config.processing.syncThresholdSigma;

  QJsonObject root;
  root["source"] = source;
  root["channel"] = channel;
  root["processing"] = processing;
  // Stored as text: JSON numbers lose precision above 2^53.
  if (config.seed)
    root["seed"] = QString::number(*config.seed);
  return root;
}

std::optional<core::SimulationConfig> fromJson(const QJsonObject &root,
                                               QString *error) {
  core::SimulationConfig cfg;
  QJsonObject source, channel, processing;
  if (!readGroup(root, "source", &source, error) ||
      !readGroup(root, "channel", &channel, error) ||
      !readGroup(root, "processing", &processing, error))
    return std::nullopt;

  const QString s("source"), c("channel"), p("processing");
  if (!readDouble(source, "signal_power", &cfg.source.signalPower, s, error) ||
      !readDouble(source, "decoy_power", &cfg.source.decoyPower, s, error) ||
      !readDouble(source, "signal_probability",
                  &cfg.source.signalProbability, s, error) ||
      !readInt(source, "block_size", &cfg.source.blockSize, s, error))
    return std::nullopt;

  if (channel.contains("loss_probability") && channel.contains("loss_db")) {
    setError(error, "channel.loss_probability and channel.loss_db are "
                    "mutually exclusive");
    return std::nullopt;
  }
  if (!readDouble(channel, "loss_probability", &cfg.channel.lossProbability,
                  c, error) ||
      !readDouble(channel, "dark_count_rate", &cfg.channel.darkCountRate, c,
                  error) ||
      !readDouble(channel, "time_bin_width", &cfg.channel.timeBinWidth, c,
                  error) ||
      !readInt(channel, "sync_offset_true", &cfg.channel.syncOffsetTrue, c,
               error) ||
      !readDouble(channel, "sync_jitter_std", &cfg.channel.syncJitterStd, c,
                  error))
    return std::nullopt;
  if (channel.contains("loss_db")) {
    double lossDb = 0.0;
    if (!readDouble(channel, "loss_db", &lossDb, c, error))
      return std::nullopt;
    try {
      cfg.channel.lossProbability = sim::lossProbabilityFromDb(lossDb);
    } catch (const core::SimulationError &e) {
      setError(error, QString("channel.loss_db: %1").arg(e.what()));
      return std::nullopt;
    }
  }

  if (!readInt(processing, "max_offset", &cfg.processing.maxOffset, p,
               error) ||
      !readDouble(processing, "sync_threshold_sigma",
                  &cfg.processing.syncThresholdSigma, p, error))
    return std::nullopt;

  const auto seed = root.value("seed");
  if (seed.isString()) {
    bool ok = false;
    const auto value = seed.toString().toULongLong(&ok);
    if (!ok) {
      setError(error, "seed must be an unsigned integer");
      return std::nullopt;
    }
    cfg.seed = value;
  } else if (seed.isDouble()) {
    const double d = seed.toDouble();
    if (d < 0.0 || std::floor(d) != d || d > 9007199254740992.0) {
      setError(error, "seed must be an unsigned integer");
      return std::nullopt;
    }
    cfg.seed = static_cast<std::uint64_t>(d);
  } else if (!seed.isUndefined() && !seed.isNull()) {
    setError(error, "seed must be an unsigned integer");
    return std::nullopt;
  }
  return cfg;
}

std::optional<core::SimulationConfig> loadConfig(const QString &path,
                                                 QString *error) {
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    setError(error, QString("cannot open %1: %2").arg(path, f.errorString()));
    return std::nullopt;
  }
  QJsonParseError parseError;
  const auto doc = QJsonDocument::fromJson(f.readAll(), &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    setError(error, QString("%1: %2").arg(path, parseError.errorString()));
    return std::nullopt;
  }
  if (!doc.isObject()) {
    setError(error, QString("%1: top level must be an object").arg(path));
    return std::nullopt;
  }
  auto cfg = fromJson(doc.object(), error);
  if (cfg)
    qDebug("loadConfig: %s", qPrintable(path));
  return cfg;
}

bool saveConfig(const core::SimulationConfig &config, const QString &path,
                QString *error) {
  QDir().mkpath(QFileInfo(path).absolutePath());
  QFile f(path);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    setError(error, QString("cannot write %1: %2").arg(path, f.errorString()));
    return false;
  }
  f.write(QJsonDocument(toJson(config)).toJson());
  return true;
}

} // namespace qkdsync::io
