#include "PlatformFactory.h"

#include <QDebug>

#include <memory>

#ifdef _WIN32
#include "windows/WindowsInputBackend.h"
#elif __linux__
#include "linux/LinuxInputBackend.h"
#endif

InputBackend *PlatformFactory::createBackend()
{
#ifdef _WIN32
    return new WindowsInputBackend();
#elif __linux__
    auto backend = std::make_unique<LinuxInputBackend>();
    if (!backend->isOpen())
        return nullptr;
    return backend.release();
#else
    qWarning() << "[PlatformFactory] no input backend for this platform";
    return nullptr;
#endif
}
