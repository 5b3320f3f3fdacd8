#include "MainWindow.h"
#include "SettingsDialog.h"

#include <QAction>
#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QDebug>
#include <QFont>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

namespace
{
    // HUD colours per gesture
    QString gestureColour(Gesture g)
    {
        switch (g)
        {
        case Gesture::Orbit:
            return QStringLiteral("#00c8a0");
        case Gesture::ZoomIn:
            return QStringLiteral("#ffa000");
        case Gesture::ZoomOut:
            return QStringLiteral("#e05050");
        case Gesture::Idle:
            break;
        }
        return QStringLiteral("#909090");
    }

    QString gestureLabelText(Gesture g)
    {
        switch (g)
        {
        case Gesture::Orbit:
            return QObject::tr("ORBIT");
        case Gesture::ZoomIn:
            return QObject::tr("ZOOM IN");
        case Gesture::ZoomOut:
            return QObject::tr("ZOOM OUT");
        case Gesture::Idle:
            break;
        }
        return QObject::tr("IDLE");
    }
}

MainWindow::MainWindow(const QString &configPath, QWidget *parent)
    : QMainWindow(parent),
      configPath_(configPath),
      navigation_(&inputSim_)
{
    setupUi();
    setupTray();
    reloadConfig();

    connect(&navigation_, &NavigationController::gestureChanged,
            this, &MainWindow::onGestureChanged);

    connect(&navigation_, &NavigationController::handVisibilityChanged,
            this, &MainWindow::onHandVisibilityChanged);

    connect(&navigation_, &NavigationController::tickRateChanged,
            this, &MainWindow::onTickRateChanged);

    connect(&navigation_, &NavigationController::connectionStatusChanged,
            this, &MainWindow::onConnectionStatusChanged);

    connect(trackingCheckBox_, &QCheckBox::toggled,
            this, &MainWindow::onTrackingToggled);

    if (!inputSim_.isReady())
        statusLabel_->setText(tr("No input backend: gestures are shown but not sent"));
}

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *mainLayout = new QVBoxLayout(central);

    auto *stateGroup = new QGroupBox(tr("Tracking"), central);
    auto *form = new QFormLayout(stateGroup);

    trackingCheckBox_ = new QCheckBox(tr("Enable tracking (connect to tracker)"), stateGroup);
    gestureLabel_ = new QLabel(stateGroup);
    handLabel_ = new QLabel(tr("no hand"), stateGroup);
    tickRateLabel_ = new QLabel(tr("-"), stateGroup);

    QFont big = gestureLabel_->font();
    big.setPointSize(big.pointSize() * 2);
    big.setBold(true);
    gestureLabel_->setFont(big);
    onGestureChanged(Gesture::Idle);

    form->addRow(trackingCheckBox_);
    form->addRow(tr("Gesture:"), gestureLabel_);
    form->addRow(tr("Hand:"), handLabel_);
    form->addRow(tr("Ticks/s:"), tickRateLabel_);

    mainLayout->addWidget(stateGroup);
    mainLayout->addStretch();
    setCentralWidget(central);

    auto *settingsAct = new QAction(tr("Settings..."), this);
    menuBar()->addAction(settingsAct);
    connect(settingsAct, &QAction::triggered, this, &MainWindow::openSettingsDialog);

    statusLabel_ = new QLabel(tr("Ready"), this);
    statusBar()->addWidget(statusLabel_);

    setWindowTitle(tr("Kido"));
    resize(420, 260);
}

void MainWindow::setupTray()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable())
        return;

    trayIcon_ = new QSystemTrayIcon(this);
    trayIcon_->setIcon(windowIcon());

    trayMenu_ = new QMenu(this);
    QAction *showAct = new QAction(tr("Show"), this);
    QAction *quitAct = new QAction(tr("Quit"), this);

    connect(showAct, &QAction::triggered, this, [this]()
            {
                showNormal();
                raise();
                activateWindow();
            });
    connect(quitAct, &QAction::triggered, qApp, &QApplication::quit);

    trayMenu_->addAction(showAct);
    trayMenu_->addSeparator();
    trayMenu_->addAction(quitAct);

    trayIcon_->setContextMenu(trayMenu_);

    connect(trayIcon_, &QSystemTrayIcon::activated,
            this, &MainWindow::onTrayActivated);

    trayIcon_->show();
}

void MainWindow::reloadConfig()
{
    navigation_.setConfig(Config::load(configPath_));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    navigation_.stop();
    event->accept();
}

void MainWindow::onTrackingToggled(bool checked)
{
    if (checked)
    {
        navigation_.start();
    }
    else
    {
        navigation_.stop();
        statusLabel_->setText(tr("Tracking disabled"));
    }
}

void MainWindow::onGestureChanged(Gesture gesture)
{
    gestureLabel_->setText(gestureLabelText(gesture));
    gestureLabel_->setStyleSheet(
        QStringLiteral("color: %1;").arg(gestureColour(gesture)));

    if (trayIcon_)
        trayIcon_->setToolTip(tr("Kido: %1").arg(gestureLabelText(gesture)));
}

void MainWindow::onHandVisibilityChanged(bool visible)
{
    handLabel_->setText(visible ? tr("visible") : tr("no hand"));
}

void MainWindow::onTickRateChanged(float ticksPerSecond)
{
    tickRateLabel_->setText(QString::number(ticksPerSecond, 'f', 1));
}

void MainWindow::onConnectionStatusChanged(const QString &status)
{
    statusLabel_->setText(status);
}

void MainWindow::openSettingsDialog()
{
    SettingsDialog dlg(configPath_, this);
    connect(&dlg, &SettingsDialog::configSaved, this, &MainWindow::onSettingsSaved);
    dlg.exec();
}

void MainWindow::onSettingsSaved()
{
    reloadConfig();
    if (navigation_.isRunning())
    {
        // tunables are fixed per classifier, rebuild it
        navigation_.start();
    }
    statusLabel_->setText(tr("Settings saved to %1").arg(configPath_));
}

void MainWindow::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger || reason == QSystemTrayIcon::DoubleClick)
    {
        showNormal();
        raise();
        activateWindow();
    }
}
