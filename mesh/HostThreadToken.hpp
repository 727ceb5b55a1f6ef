#pragma once
#include <thread>

// Capability issued by the host on its designated thread and required by every
// HostMeshGateway call. Holding one is the caller's promise to be on that
// thread; nothing here enforces it.
class HostThreadToken {
    std::thread::id owner;
public:
    HostThreadToken() : owner(std::this_thread::get_id()) {}

    std::thread::id getOwner() const { return owner; }
    bool isOwnerThread() const { return owner == std::this_thread::get_id(); }
};
