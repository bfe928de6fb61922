#include "LedgerLockRegistry.h"

#include <QMutexLocker>

#include <algorithm>

LedgerLockRegistry::Guard::Guard(LedgerLockRegistry &registry, int tenantId, QList<int> ingredientIds)
{
    // Единый порядок захвата исключает взаимную блокировку
    std::sort(ingredientIds.begin(), ingredientIds.end());
    ingredientIds.erase(std::unique(ingredientIds.begin(), ingredientIds.end()), ingredientIds.end());

    for (int ingredientId : ingredientIds) {
        QSharedPointer<QMutex> mutex = registry.mutexFor(tenantId, ingredientId);
        mutex->lock();
        m_locked.append(mutex);
    }
}

LedgerLockRegistry::Guard::~Guard()
{
    for (auto it = m_locked.rbegin(); it != m_locked.rend(); ++it) {
        (*it)->unlock();
    }
}

QSharedPointer<QMutex> LedgerLockRegistry::mutexFor(int tenantId, int ingredientId)
{
    QMutexLocker locker(&m_guard);
    const QPair<int, int> key(tenantId, ingredientId);
    auto it = m_mutexes.find(key);
    if (it == m_mutexes.end()) {
        it = m_mutexes.insert(key, QSharedPointer<QMutex>::create());
    }
    return it.value();
}

int LedgerLockRegistry::size() const
{
    QMutexLocker locker(&m_guard);
    return m_mutexes.size();
}
