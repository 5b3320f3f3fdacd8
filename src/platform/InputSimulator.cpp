#include "InputSimulator.h"

#include <QDebug>

#include <utility>

#include "InputBackend.h"
#include "PlatformFactory.h"

InputSimulator::InputSimulator(QObject *parent)
    : QObject(parent)
{
    backend_.reset(PlatformFactory::createBackend());
    if (!backend_)
        qWarning() << "[InputSimulator] No platform backend available, input events are dropped.";
}

InputSimulator::InputSimulator(std::unique_ptr<InputBackend> backend,
                               QObject *parent)
    : QObject(parent), backend_(std::move(backend))
{
}

InputSimulator::~InputSimulator() = default;

bool InputSimulator::isReady() const
{
    return backend_ != nullptr;
}

void InputSimulator::moveRelative(int dx, int dy)
{
    if (backend_)
        backend_->moveRelative(dx, dy);
}

void InputSimulator::middleDown()
{
    if (backend_)
        backend_->middleDown();
}

void InputSimulator::middleUp()
{
    if (backend_)
        backend_->middleUp();
}

void InputSimulator::scroll(int ticks)
{
    if (backend_)
        backend_->scroll(ticks);
}
