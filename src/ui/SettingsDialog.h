#pragma once
#include <QDialog>

#include "../core/Config.h"

QT_BEGIN_NAMESPACE
class QDoubleSpinBox;
class QSpinBox;
class QLineEdit;
class QPushButton;
QT_END_NAMESPACE

class SettingsDialog : public QDialog
{
    Q_OBJECT
public:
    explicit SettingsDialog(const QString &configPath, QWidget *parent = nullptr);

signals:
    void configSaved();

private slots:
    void onApply();
    void onReset();

private:
    void loadFromConfig();
    void showConfig(const AppConfig &cfg);
    AppConfig collect() const;

    QString configPath_;

    // tracker
    QLineEdit *hostEdit_;
    QSpinBox *portSpin_;

    // classifier
    QDoubleSpinBox *emaAlphaSpin_;
    QSpinBox *confidenceSpin_;
    QDoubleSpinBox *deadZoneSpin_;
    QDoubleSpinBox *zoomSpeedSpin_;
    QDoubleSpinBox *cooldownSpin_;
    QDoubleSpinBox *orbitOpennessSpin_;

    // viewport
    QDoubleSpinBox *sensXSpin_;
    QDoubleSpinBox *sensYSpin_;
    QSpinBox *zoomInScrollSpin_;
    QSpinBox *zoomOutScrollSpin_;
    QDoubleSpinBox *scrollIntervalSpin_;

    QPushButton *applyBtn_;
    QPushButton *resetBtn_;

    // values without a widget are carried through unchanged
    AppConfig loaded_;
};
