#pragma once

#include <QMainWindow>
#include <QSystemTrayIcon>

#include "../common/Types.h"
#include "../core/NavigationController.h"
#include "../platform/InputSimulator.h"

class QCheckBox;
class QLabel;
class QMenu;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const QString &configPath, QWidget *parent = nullptr);
    ~MainWindow() override = default;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onTrackingToggled(bool checked);
    void onGestureChanged(Gesture gesture);
    void onHandVisibilityChanged(bool visible);
    void onTickRateChanged(float ticksPerSecond);
    void onConnectionStatusChanged(const QString &status);

    void openSettingsDialog();
    void onSettingsSaved();

    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void setupUi();
    void setupTray();
    void reloadConfig();

private:
    QCheckBox *trackingCheckBox_ = nullptr;
    QLabel *gestureLabel_ = nullptr;
    QLabel *handLabel_ = nullptr;
    QLabel *tickRateLabel_ = nullptr;
    QLabel *statusLabel_ = nullptr;

    QSystemTrayIcon *trayIcon_ = nullptr;
    QMenu *trayMenu_ = nullptr;

    QString configPath_;

    // inputSim_ must outlive navigation_
    InputSimulator inputSim_;
    NavigationController navigation_;
};
