#pragma once

class InputBackend;

class PlatformFactory
{
public:
    // nullptr when the platform has no backend or it failed to open
    static InputBackend *createBackend();
};
