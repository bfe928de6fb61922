#ifndef DBMANAGER_H
#define DBMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Управление подключениями SQLite
 *
 * Соединение QSqlDatabase можно использовать только в потоке, который его
 * открыл, поэтому рабочие потоки открывают собственные именованные соединения
 * через openConnection().
 */
class DbManager : public QObject
{
    Q_OBJECT

public:
    static DbManager& instance();

    bool initialize(const QString &databasePath, int busyTimeoutMs = 5000);
    bool isOpen() const;

    QSqlDatabase database() const;
    QString databasePath() const;

    void close();

    static QSqlDatabase openConnection(const QString &databasePath,
                                       const QString &connectionName,
                                       int busyTimeoutMs = 5000);
    static void closeConnection(const QString &connectionName);

private:
    explicit DbManager();
    ~DbManager() override = default;

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

private:
    QSqlDatabase m_db;
    QString m_databasePath;

private:
    static bool enableForeignKeys(QSqlDatabase &db);
    static bool enableWriteAheadLog(QSqlDatabase &db);
};

#endif // DBMANAGER_H
