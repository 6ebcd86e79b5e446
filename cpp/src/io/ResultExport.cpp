#include "qkdsync/io/ResultExport.h"
#include "qkdsync/io/ConfigIO.h"
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

namespace qkdsync::io {

namespace {

bool openForWrite(QFile &f, QString *error) {
  if (f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    return true;
  if (error)
    *error = QString("cannot write %1: %2").arg(f.fileName(), f.errorString());
  return false;
}

} // namespace

bool exportCorrelationCsv(const data::SimulationResult &result,
                          const QString &path, QString *error) {
  QFile f(path);
  if (!openForWrite(f, error))
    return false;
  QTextStream out(&f);
  out.setRealNumberPrecision(12);
  out << "offset,time_s,correlation\n";
  const auto &corr = result.correlation;
  for (std::size_t i = 0; i < corr.offsets.size(); ++i) {
    out << corr.offsets[i] << "," << result.timePoints[i] << ","
        << corr.correlationValues[i] << "\n";
  }
  qDebug("exportCorrelationCsv: %zu rows -> %s", corr.offsets.size(),
         qPrintable(path));
  return true;
}

bool exportCountsCsv(const data::SimulationResult &result,
                     const QString &path, QString *error) {
  QFile f(path);
  if (!openForWrite(f, error))
    return false;
  QTextStream out(&f);
  out.setRealNumberPrecision(12);
  out << "bin,time_s,counts\n";
  const auto &det = result.detected;
  for (std::size_t b = 0; b < det.size(); ++b)
    out << b << "," << det.timeOf(b) << "," << det.counts[b] << "\n";
  qDebug("exportCountsCsv: %zu rows -> %s", det.size(), qPrintable(path));
  return true;
}

QJsonObject resultToJson(const data::SimulationResult &result) {
  QJsonArray timePoints, correlation, counts;
  for (double t : result.timePoints)
    timePoints.append(t);
  for (double c : result.correlation.correlationValues)
    correlation.append(c);
  for (auto c : result.detected.counts)
    counts.append(static_cast<qint64>(c));

  const auto &st = result.statistics;
  QJsonObject stats;
  stats["total_counts"] = static_cast<qint64>(st.totalCounts);
  stats["mean_count_rate"] = st.meanCountRate;
  stats["qber"] = st.qber;
  stats["sync_success"] = st.syncSuccess;
  stats["degenerate"] = st.degenerate;
  stats["signal_counts"] = static_cast<qint64>(st.signalCounts);
  stats["decoy_counts"] = static_cast<qint64>(st.decoyCounts);
  stats["dark_counts"] = static_cast<qint64>(st.darkCounts);
  stats["error_counts"] = static_cast<qint64>(st.errorCounts);

  QJsonObject metrics;
  for (const auto &[name, value] : result.metrics)
    metrics[QString::fromStdString(name)] = value;

  QJsonObject root;
  root["seed"] = QString::number(result.seed);
  root["config"] = toJson(result.config);
  root["time_points"] = timePoints;
  root["cross_correlation"] = correlation;
  root["counts"] = counts;
  root["peak_position"] = result.correlation.peakOffset;
  root["peak_value"] = result.correlation.peakValue;
  root["statistics"] = stats;
  root["metrics"] = metrics;
  return root;
}

bool exportResultJson(const data::SimulationResult &result,
                      const QString &path, QString *error) {
  QFile f(path);
  if (!openForWrite(f, error))
    return false;
  f.write(QJsonDocument(resultToJson(result)).toJson());
  return true;
}

} // namespace qkdsync::io
