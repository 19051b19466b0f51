#include "threading/Mutex.hpp"

void Mutex::lock() {
    _mutex.lock();
}

void Mutex::unlock() {
    _mutex.unlock();
}

ScopedLock::ScopedLock(Mutex& mutex) : _mutex(mutex) {
    _mutex.lock();
}

ScopedLock::~ScopedLock() {
    _mutex.unlock();
}
