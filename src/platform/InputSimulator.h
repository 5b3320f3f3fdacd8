#pragma once

#include <memory>

#include <QObject>

class InputBackend;

class InputSimulator : public QObject
{
    Q_OBJECT

public:
    explicit InputSimulator(QObject *parent = nullptr);
    // Takes an explicit backend, used by tests
    explicit InputSimulator(std::unique_ptr<InputBackend> backend,
                            QObject *parent = nullptr);
    ~InputSimulator();

    bool isReady() const;

    void moveRelative(int dx, int dy);
    void middleDown();
    void middleUp();
    void scroll(int ticks); // positive = up, negative = down

private:
    std::unique_ptr<InputBackend> backend_;
};
