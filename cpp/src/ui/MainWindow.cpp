#include "qkdsync/ui/MainWindow.h"
#include "qkdsync/core/Simulator.h"
#include "qkdsync/io/ConfigIO.h"
#include "qkdsync/io/ResultExport.h"

#ifdef QKDSYNC_ENABLE_CHARTS
#include <QtCharts/QChart>
#include <QtCharts/QChartView>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#endif

#include <QDebug>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSpinBox>
#include <QStandardPaths>
#include <QStatusBar>
#include <QTabWidget>
#include <QVBoxLayout>
#include <algorithm>

namespace qkdsync::ui {

MainWindow::MainWindow(QWidget *parent) : QMainWindow(parent) {
  resize(1200, 720);
  setWindowTitle("qkdsync - decoy-state link synchronisation");
  setupUi();

  connect(&timer_, &QTimer::timeout, this, &MainWindow::runOnce);
  timer_.setInterval(250);
  qDebug("MainWindow: constructed");
}

void MainWindow::setupUi() {
#ifdef QKDSYNC_ENABLE_CHARTS
  auto *central = new QWidget(this);
  mainLayout_ = new QVBoxLayout(central);

  // Parameter panel: source | channel | processing
  auto *params = new QWidget(central);
  auto *pl = new QHBoxLayout(params);
  auto makeDouble = [params](double lo, double hi, double step, int decimals) {
    auto *s = new QDoubleSpinBox(params);
    s->setRange(lo, hi);
    s->setSingleStep(step);
    s->setDecimals(decimals);
    return s;
  };
  auto makeInt = [params](int lo, int hi) {
    auto *s = new QSpinBox(params);
    s->setRange(lo, hi);
    return s;
  };

  auto *sourceForm = new QFormLayout;
  signalPowerSpin_ = makeDouble(0.0, 10.0, 0.05, 3);
  decoyPowerSpin_ = makeDouble(0.0, 10.0, 0.05, 3);
  signalProbSpin_ = makeDouble(0.0, 1.0, 0.05, 3);
  blockSizeSpin_ = makeInt(1, 10'000'000);
  sourceForm->addRow("Signal mu", signalPowerSpin_);
  sourceForm->addRow("Decoy mu", decoyPowerSpin_);
  sourceForm->addRow("P(signal)", signalProbSpin_);
  sourceForm->addRow("Block size", blockSizeSpin_);

  auto *channelForm = new QFormLayout;
  lossSpin_ = makeDouble(0.0, 1.0, 0.01, 4);
  darkSpin_ = makeDouble(0.0, 10.0, 0.001, 4);
  timeBinSpin_ = makeDouble(1.0, 1e6, 10.0, 1); // shown in ps
  offsetSpin_ = makeInt(-100'000, 100'000);
  jitterSpin_ = makeDouble(0.0, 1000.0, 0.1, 2);
  channelForm->addRow("Loss P", lossSpin_);
  channelForm->addRow("Dark / bin", darkSpin_);
  channelForm->addRow("Bin (ps)", timeBinSpin_);
  channelForm->addRow("Offset (bins)", offsetSpin_);
  channelForm->addRow("Jitter (bins)", jitterSpin_);

  auto *procForm = new QFormLayout;
  maxOffsetSpin_ = makeInt(1, 1'000'000);
  sigmaSpin_ = makeDouble(0.0, 100.0, 0.5, 2);
  procForm->addRow("Max offset", maxOffsetSpin_);
  procForm->addRow("Sync sigma", sigmaSpin_);
  auto *runBtn = new QPushButton("Run", params);
  repeatBtn_ = new QPushButton("Repeat", params);
  repeatBtn_->setCheckable(true);
  auto *btnExport = new QPushButton("Export CSV", params);
  procForm->addRow(runBtn);
  procForm->addRow(repeatBtn_);
  procForm->addRow(btnExport);

  pl->addLayout(sourceForm);
  pl->addSpacing(12);
  pl->addLayout(channelForm);
  pl->addSpacing(12);
  pl->addLayout(procForm);
  pl->addStretch(1);
  mainLayout_->addWidget(params, 0);

  tabs_ = new QTabWidget(central);
  mainLayout_->addWidget(tabs_, 1);
  setupChartTabs();
  setCentralWidget(central);

  connect(runBtn, &QPushButton::clicked, this, &MainWindow::runOnce);
  connect(repeatBtn_, &QPushButton::clicked, this, &MainWindow::toggleRepeat);
  connect(btnExport, &QPushButton::clicked, this, &MainWindow::exportCsv);
#else
  auto *central = new QWidget(this);
  auto *layout = new QHBoxLayout(central);
  layout->addWidget(
      new QLabel("Qt Charts not available. Build with QKDSYNC_ENABLE_CHARTS=ON "
                 "after installing qtcharts; qkdsync_cli offers the same "
                 "simulation."));
  setCentralWidget(central);
#endif
}

#ifdef QKDSYNC_ENABLE_CHARTS
QChart *MainWindow::makeChart(const QString &title, const QString &xTitle,
                              const QString &yTitle, QValueAxis **axX,
                              QValueAxis **axY) {
  auto *tab = new QWidget(tabs_);
  auto *layout = new QVBoxLayout(tab);
  auto *chart = new QChart();
  chart->setTitle(title);
  *axX = new QValueAxis;
  *axY = new QValueAxis;
  (*axX)->setTitleText(xTitle);
  (*axY)->setTitleText(yTitle);
  chart->addAxis(*axX, Qt::AlignBottom);
  chart->addAxis(*axY, Qt::AlignLeft);
  auto *view = new QChartView(chart);
  view->setRenderHint(QPainter::Antialiasing);
  layout->addWidget(view);
  tabs_->addTab(tab, title);
  return chart;
}

void MainWindow::setupChartTabs() {
  corrChart_ = makeChart("Cross-correlation", "Offset (bins)", "C(k)",
                         &corrAxisX_, &corrAxisY_);
  countsChart_ = makeChart("Detected counts", "Time (ns)", "Counts",
                           &countsAxisX_, &countsAxisY_);
  metricsChart_ = makeChart("Runs", "Run", "Value", &metricsAxisX_,
                            &metricsAxisY_);

  qberSeries_ = new QLineSeries(metricsChart_);
  qberSeries_->setName("qber");
  sigSeries_ = new QLineSeries(metricsChart_);
  sigSeries_->setName("sync significance");
  for (auto *s : {qberSeries_, sigSeries_}) {
    metricsChart_->addSeries(s);
    s->attachAxis(metricsAxisX_);
    s->attachAxis(metricsAxisY_);
  }
}
#endif

QString MainWindow::configPath() const {
  if (!configFile_.isEmpty())
    return configFile_;
  return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) +
         "/qkdsync_gui.json";
}

void MainWindow::loadConfig() {
  QString error;
  auto loaded = io::loadConfig(configPath(), &error);
  if (loaded) {
    cfg_ = *loaded;
  } else {
    qDebug("loadConfig: using defaults (%s)", qPrintable(error));
  }
  writeControls();
}

void MainWindow::saveConfig() {
  QString error;
  if (!io::saveConfig(cfg_, configPath(), &error))
    qWarning("saveConfig: %s", qPrintable(error));
}

void MainWindow::writeControls() {
#ifdef QKDSYNC_ENABLE_CHARTS
  signalPowerSpin_->setValue(cfg_.source.signalPower);
  decoyPowerSpin_->setValue(cfg_.source.decoyPower);
  signalProbSpin_->setValue(cfg_.source.signalProbability);
  blockSizeSpin_->setValue(cfg_.source.blockSize);
  lossSpin_->setValue(cfg_.channel.lossProbability);
  darkSpin_->setValue(cfg_.channel.darkCountRate);
  timeBinSpin_->setValue(cfg_.channel.timeBinWidth * 1e12);
  offsetSpin_->setValue(cfg_.channel.syncOffsetTrue);
  jitterSpin_->setValue(cfg_.channel.syncJitterStd);
  maxOffsetSpin_->setValue(cfg_.processing.maxOffset);
  sigmaSpin_->setValue(cfg_.processing.syncThresholdSigma);
#endif
}

void MainWindow::readControls() {
#ifdef QKDSYNC_ENABLE_CHARTS
  cfg_.source.signalPower = signalPowerSpin_->value();
  cfg_.source.decoyPower = decoyPowerSpin_->value();
  cfg_.source.signalProbability = signalProbSpin_->value();
  cfg_.source.blockSize = blockSizeSpin_->value();
  cfg_.channel.lossProbability = lossSpin_->value();
  cfg_.channel.darkCountRate = darkSpin_->value();
  cfg_.channel.timeBinWidth = timeBinSpin_->value() * 1e-12;
  cfg_.channel.syncOffsetTrue = offsetSpin_->value();
  cfg_.channel.syncJitterStd = jitterSpin_->value();
  cfg_.processing.maxOffset = maxOffsetSpin_->value();
  cfg_.processing.syncThresholdSigma = sigmaSpin_->value();
#endif
}

void MainWindow::runOnce() {
  readControls();
  saveConfig();

  // Each run draws a fresh seed unless the loaded config pinned one.
  try {
    auto result = core::runSimulation(cfg_);
    showResult(result);
    appendMetrics(result);
    latest_ = std::move(result);
  } catch (const core::SimulationError &e) {
    timer_.stop();
#ifdef QKDSYNC_ENABLE_CHARTS
    repeatBtn_->setChecked(false);
#endif
    qWarning("runOnce: %s", e.what());
    statusBar()->showMessage(
        QString("[%1] %2")
            .arg(QString::fromLatin1(core::toString(e.kind())),
                 QString::fromUtf8(e.what())));
  }
}

void MainWindow::toggleRepeat() {
  if (timer_.isActive()) {
    timer_.stop();
    statusBar()->showMessage("Repeat stopped");
  } else {
    runCount_ = 0;
    syncCount_ = 0;
#ifdef QKDSYNC_ENABLE_CHARTS
    qberSeries_->clear();
    sigSeries_->clear();
#endif
    timer_.start();
  }
}

void MainWindow::showResult(const data::SimulationResult &result) {
#ifdef QKDSYNC_ENABLE_CHARTS
  auto *corr = new QLineSeries(corrChart_);
  corr->setName("C(k)");
  const auto &c = result.correlation;
  for (std::size_t i = 0; i < c.offsets.size(); ++i)
    corr->append(c.offsets[i], c.correlationValues[i]);
  corrChart_->removeAllSeries();
  corrChart_->addSeries(corr);
  corr->attachAxis(corrAxisX_);
  corr->attachAxis(corrAxisY_);
  corrAxisX_->setRange(c.offsets.front(), c.offsets.back());
  const double corrMax =
      *std::max_element(c.correlationValues.begin(), c.correlationValues.end());
  corrAxisY_->setRange(0.0, std::max(1.0, corrMax * 1.2));

  auto *counts = new QLineSeries(countsChart_);
  counts->setName("detections");
  const auto &det = result.detected;
  double countsMax = 1.0;
  for (std::size_t b = 0; b < det.size(); ++b) {
    counts->append(det.timeOf(b) * 1e9, det.counts[b]);
    countsMax = std::max<double>(countsMax, det.counts[b]);
  }
  countsChart_->removeAllSeries();
  countsChart_->addSeries(counts);
  counts->attachAxis(countsAxisX_);
  counts->attachAxis(countsAxisY_);
  countsAxisX_->setRange(0.0, det.timeOf(det.size()) * 1e9);
  countsAxisY_->setRange(0.0, countsMax * 1.2);
#endif

  const auto &st = result.statistics;
  QString msg = QString("Peak %1 (true %2) | %3 | counts %4 | rate %5 cps | "
                        "QBER %6")
                    .arg(result.correlation.peakOffset)
                    .arg(result.config.channel.syncOffsetTrue)
                    .arg(st.syncSuccess ? "synced" : "NO SYNC")
                    .arg(static_cast<qulonglong>(st.totalCounts))
                    .arg(st.meanCountRate, 0, 'g', 4)
                    .arg(st.qber, 0, 'f', 4);
  if (st.degenerate)
    msg += " | degenerate (no detections)";
  statusBar()->showMessage(msg);
}

void MainWindow::appendMetrics(const data::SimulationResult &result) {
  ++runCount_;
  syncCount_ += result.statistics.syncSuccess ? 1 : 0;
#ifdef QKDSYNC_ENABLE_CHARTS
  qberSeries_->append(runCount_, result.statistics.qber);
  const auto it = result.metrics.find("sync_significance");
  sigSeries_->append(runCount_, it != result.metrics.end() ? it->second : 0.0);
  metricsAxisX_->setRange(0.0, runCount_ + 1.0);

  double maxY = 1.0;
  for (auto *s : {qberSeries_, sigSeries_}) {
    for (const auto &p : s->points())
      maxY = std::max(maxY, p.y());
  }
  metricsAxisY_->setRange(0.0, maxY * 1.2);
  metricsChart_->setTitle(QString("Runs (sync %1 / %2)")
                              .arg(syncCount_)
                              .arg(runCount_));
#endif
}

void MainWindow::exportCsv() {
  if (!latest_) {
    statusBar()->showMessage("Nothing to export; run a simulation first.");
    return;
  }
  const QString dir = QFileDialog::getExistingDirectory(this, "Export CSV");
  if (dir.isEmpty())
    return;
  QString error;
  if (!io::exportCorrelationCsv(*latest_, dir + "/correlation.csv", &error) ||
      !io::exportCountsCsv(*latest_, dir + "/counts.csv", &error)) {
    statusBar()->showMessage(error);
    return;
  }
  statusBar()->showMessage("Exported correlation.csv and counts.csv to " +
                           QDir::toNativeSeparators(dir));
}

} // namespace qkdsync::ui
