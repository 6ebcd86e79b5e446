#pragma once

#include "qkdsync/core/SimulationConfig.h"
#include "qkdsync/data/SimulationResult.h"
#include <QMainWindow>
#include <QTimer>
#include <optional>

#ifdef QKDSYNC_ENABLE_CHARTS
QT_BEGIN_NAMESPACE
class QChart;
class QChartView;
class QDoubleSpinBox;
class QLineSeries;
class QPushButton;
class QSpinBox;
class QTabWidget;
class QValueAxis;
class QVBoxLayout;
QT_END_NAMESPACE
#endif

namespace qkdsync::ui {

/**
 * @brief Interactive front end for the link simulation.
 *
 * Responsibilities:
 *  - edit SimulationConfig through spin boxes and persist it as JSON
 *  - run single simulations or repeat them on a timer with fresh seeds
 *  - plot the correlation series, the detected counts and per-run metrics
 */
class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget *parent = nullptr);

  void setConfigFile(const QString &path) { configFile_ = path; }
  /// Load the persisted configuration (or defaults) into the controls.
  void loadConfig();

private slots:
  void runOnce();
  void toggleRepeat();
  void exportCsv();

private:
  void setupUi();
#ifdef QKDSYNC_ENABLE_CHARTS
  void setupChartTabs();
  QChart *makeChart(const QString &title, const QString &xTitle,
                    const QString &yTitle, QValueAxis **axX,
                    QValueAxis **axY);
#endif
  void readControls();
  void writeControls();
  void showResult(const data::SimulationResult &result);
  void appendMetrics(const data::SimulationResult &result);
  void saveConfig();
  QString configPath() const;

  core::SimulationConfig cfg_;
  std::optional<data::SimulationResult> latest_;
  QTimer timer_;
  QString configFile_;
  int runCount_{0};
  int syncCount_{0};

#ifdef QKDSYNC_ENABLE_CHARTS
  QVBoxLayout *mainLayout_{nullptr};
  QTabWidget *tabs_{nullptr};
  QChart *corrChart_{nullptr};
  QChart *countsChart_{nullptr};
  QChart *metricsChart_{nullptr};
  QValueAxis *corrAxisX_{nullptr};
  QValueAxis *corrAxisY_{nullptr};
  QValueAxis *countsAxisX_{nullptr};
  QValueAxis *countsAxisY_{nullptr};
  QValueAxis *metricsAxisX_{nullptr};
  QValueAxis *metricsAxisY_{nullptr};
  QLineSeries *qberSeries_{nullptr};
  QLineSeries *sigSeries_{nullptr};
  QDoubleSpinBox *signalPowerSpin_{nullptr};
  QDoubleSpinBox *decoyPowerSpin_{nullptr};
  QDoubleSpinBox *signalProbSpin_{nullptr};
  QSpinBox *blockSizeSpin_{nullptr};
  QDoubleSpinBox *lossSpin_{nullptr};
  QDoubleSpinBox *darkSpin_{nullptr};
  QDoubleSpinBox *timeBinSpin_{nullptr};
  QSpinBox *offsetSpin_{nullptr};
  QDoubleSpinBox *jitterSpin_{nullptr};
  QSpinBox *maxOffsetSpin_{nullptr};
  QDoubleSpinBox *sigmaSpin_{nullptr};
  QPushButton *repeatBtn_{nullptr};
#endif
};

} // namespace qkdsync::ui
