#include "SettingsDialog.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QDoubleSpinBox>
#include <QSpinBox>
#include <QPushButton>
#include <QFile>
#include <QMessageBox>

namespace
{
    QDoubleSpinBox *makeDouble(double min, double max, int decimals, double step)
    {
        auto *spin = new QDoubleSpinBox();
        spin->setRange(min, max);
        spin->setDecimals(decimals);
        spin->setSingleStep(step);
        return spin;
    }
}

SettingsDialog::SettingsDialog(const QString &configPath, QWidget *parent)
    : QDialog(parent), configPath_(configPath)
{
    setWindowTitle(tr("Kido Settings"));
    auto *layout = new QVBoxLayout(this);

    // tracker
    layout->addWidget(new QLabel(tr("Tracker connection:"), this));
    auto *hBox0 = new QHBoxLayout();
    hostEdit_ = new QLineEdit();
    portSpin_ = new QSpinBox();
    portSpin_->setRange(1, 65535);
    hBox0->addWidget(new QLabel(tr("host:")));
    hBox0->addWidget(hostEdit_);
    hBox0->addWidget(new QLabel(tr("port:")));
    hBox0->addWidget(portSpin_);
    layout->addLayout(hBox0);

    // classifier
    layout->addWidget(new QLabel(tr("Classifier:"), this));
    auto *hBox1 = new QHBoxLayout();
    emaAlphaSpin_ = makeDouble(0.01, 1.0, 2, 0.05);
    confidenceSpin_ = new QSpinBox();
    confidenceSpin_->setRange(1, 30);
    deadZoneSpin_ = makeDouble(0.0, 0.2, 3, 0.001);
    hBox1->addWidget(new QLabel(tr("ema alpha:")));
    hBox1->addWidget(emaAlphaSpin_);
    hBox1->addWidget(new QLabel(tr("confidence frames:")));
    hBox1->addWidget(confidenceSpin_);
    hBox1->addWidget(new QLabel(tr("orbit dead zone:")));
    hBox1->addWidget(deadZoneSpin_);
    layout->addLayout(hBox1);

    auto *hBox2 = new QHBoxLayout();
    zoomSpeedSpin_ = makeDouble(0.0, 20.0, 2, 0.1);
    cooldownSpin_ = makeDouble(0.0, 5.0, 2, 0.05);
    orbitOpennessSpin_ = makeDouble(0.0, 1.0, 2, 0.05);
    hBox2->addWidget(new QLabel(tr("zoom speed:")));
    hBox2->addWidget(zoomSpeedSpin_);
    hBox2->addWidget(new QLabel(tr("zoom->orbit cooldown (s):")));
    hBox2->addWidget(cooldownSpin_);
    hBox2->addWidget(new QLabel(tr("orbit openness:")));
    hBox2->addWidget(orbitOpennessSpin_);
    layout->addLayout(hBox2);

    // viewport
    layout->addWidget(new QLabel(tr("Viewport output:"), this));
    auto *hBox3 = new QHBoxLayout();
    sensXSpin_ = makeDouble(-100.0, 100.0, 2, 0.1);
    sensYSpin_ = makeDouble(-100.0, 100.0, 2, 0.1);
    hBox3->addWidget(new QLabel(tr("orbit sensitivity x:")));
    hBox3->addWidget(sensXSpin_);
    hBox3->addWidget(new QLabel(tr("y:")));
    hBox3->addWidget(sensYSpin_);
    layout->addLayout(hBox3);

    auto *hBox4 = new QHBoxLayout();
    zoomInScrollSpin_ = new QSpinBox();
    zoomInScrollSpin_->setRange(-120, 120);
    zoomOutScrollSpin_ = new QSpinBox();
    zoomOutScrollSpin_->setRange(-120, 120);
    scrollIntervalSpin_ = makeDouble(0.0, 10.0, 3, 0.01);
    hBox4->addWidget(new QLabel(tr("zoom in scroll:")));
    hBox4->addWidget(zoomInScrollSpin_);
    hBox4->addWidget(new QLabel(tr("zoom out scroll:")));
    hBox4->addWidget(zoomOutScrollSpin_);
    hBox4->addWidget(new QLabel(tr("scroll interval (s):")));
    hBox4->addWidget(scrollIntervalSpin_);
    layout->addLayout(hBox4);

    // buttons
    auto *btnBox = new QHBoxLayout();
    applyBtn_ = new QPushButton(tr("Apply"));
    resetBtn_ = new QPushButton(tr("Reset"));
    btnBox->addStretch();
    btnBox->addWidget(resetBtn_);
    btnBox->addWidget(applyBtn_);
    layout->addLayout(btnBox);

    connect(applyBtn_, &QPushButton::clicked, this, &SettingsDialog::onApply);
    connect(resetBtn_, &QPushButton::clicked, this, &SettingsDialog::onReset);

    loadFromConfig();
}

void SettingsDialog::loadFromConfig()
{
    loaded_ = Config::load(configPath_);
    showConfig(loaded_);
}

void SettingsDialog::showConfig(const AppConfig &cfg)
{
    hostEdit_->setText(cfg.tracker.host);
    portSpin_->setValue(cfg.tracker.port);

    const ClassifierConfig &c = cfg.classifier;
    emaAlphaSpin_->setValue(c.emaAlpha);
    confidenceSpin_->setValue(c.confidenceFrames);
    deadZoneSpin_->setValue(c.orbitDeadZone);
    zoomSpeedSpin_->setValue(c.zoomSpeedThreshold);
    cooldownSpin_->setValue(c.orbitAfterZoomCooldown);
    orbitOpennessSpin_->setValue(c.orbitMinOpenness);

    const ViewportConfig &v = cfg.viewport;
    sensXSpin_->setValue(v.orbitSensitivityX);
    sensYSpin_->setValue(v.orbitSensitivityY);
    zoomInScrollSpin_->setValue(v.zoomInScroll);
    zoomOutScrollSpin_->setValue(v.zoomOutScroll);
    scrollIntervalSpin_->setValue(v.zoomScrollInterval);
}

AppConfig SettingsDialog::collect() const
{
    AppConfig cfg = loaded_;

    cfg.tracker.host = hostEdit_->text().trimmed();
    cfg.tracker.port = static_cast<quint16>(portSpin_->value());

    ClassifierConfig &c = cfg.classifier;
    c.emaAlpha = emaAlphaSpin_->value();
    c.confidenceFrames = confidenceSpin_->value();
    c.orbitDeadZone = deadZoneSpin_->value();
    c.zoomSpeedThreshold = zoomSpeedSpin_->value();
    c.orbitAfterZoomCooldown = cooldownSpin_->value();
    c.orbitMinOpenness = orbitOpennessSpin_->value();

    ViewportConfig &v = cfg.viewport;
    v.orbitSensitivityX = sensXSpin_->value();
    v.orbitSensitivityY = sensYSpin_->value();
    v.zoomInScroll = zoomInScrollSpin_->value();
    v.zoomOutScroll = zoomOutScrollSpin_->value();
    v.zoomScrollInterval = scrollIntervalSpin_->value();

    return cfg;
}

void SettingsDialog::onApply()
{
    QString error;
    if (!Config::save(collect(), configPath_, &error))
    {
        QMessageBox::warning(this, tr("Write error"),
                             tr("Failed to write %1: %2").arg(configPath_, error));
        return;
    }

    emit configSaved();
    accept();
}

void SettingsDialog::onReset()
{
    // remove file if exists
    if (QFile::exists(configPath_) && !QFile::remove(configPath_))
    {
        QMessageBox::warning(this, tr("Reset failed"),
                             tr("Could not remove %1").arg(configPath_));
        return;
    }
    loadFromConfig();
    emit configSaved();
}
