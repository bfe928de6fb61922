#ifndef LEDGERLOCKREGISTRY_H
#define LEDGERLOCKREGISTRY_H

#include <QHash>
#include <QList>
#include <QMutex>
#include <QPair>
#include <QSharedPointer>

/**
 * @brief Мьютексы на пару (тенант, ингредиент)
 *
 * Расход одного ингредиента сериализуется, разные ингредиенты списываются
 * параллельно. Мьютексы создаются по требованию и живут до уничтожения реестра.
 */
class LedgerLockRegistry
{
public:
    LedgerLockRegistry() = default;

    LedgerLockRegistry(const LedgerLockRegistry&) = delete;
    LedgerLockRegistry& operator=(const LedgerLockRegistry&) = delete;

    /**
     * @brief Захватывает мьютексы всех ингредиентов в порядке возрастания id
     * и отпускает их в деструкторе
     */
    class Guard
    {
    public:
        Guard(LedgerLockRegistry &registry, int tenantId, QList<int> ingredientIds);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        QList<QSharedPointer<QMutex>> m_locked;
    };

    QSharedPointer<QMutex> mutexFor(int tenantId, int ingredientId);

    int size() const;

private:
    mutable QMutex m_guard;
    QHash<QPair<int, int>, QSharedPointer<QMutex>> m_mutexes;
};

#endif // LEDGERLOCKREGISTRY_H
