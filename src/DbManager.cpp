#include "DbManager.h"

#include <QDebug>
#include <QSqlQuery>
#include <QSqlError>

static const char *kDefaultConnectionName = "KitchenCostConnection";

DbManager& DbManager::instance()
{
    static DbManager instance;
    return instance;
}

DbManager::DbManager()
{
}

bool DbManager::initialize(const QString &databasePath, int busyTimeoutMs)
{
    m_databasePath = databasePath;
    m_db = openConnection(databasePath, kDefaultConnectionName, busyTimeoutMs);
    if (!m_db.isOpen()) {
        qCritical() << "DbManager: initialize failed for" << databasePath;
        return false;
    }

    qInfo() << "DbManager: Database opened successfully at" << m_databasePath;
    return true;
}

bool DbManager::isOpen() const
{
    return m_db.isOpen();
}

QSqlDatabase DbManager::database() const
{
    return m_db;
}

QString DbManager::databasePath() const
{
    return m_databasePath;
}

void DbManager::close()
{
    if (m_db.isOpen()) {
        m_db.close();
        qInfo() << "DbManager: Database connection closed";
    }
    m_db = QSqlDatabase();
    closeConnection(kDefaultConnectionName);
}

QSqlDatabase DbManager::openConnection(const QString &databasePath,
                                       const QString &connectionName,
                                       int busyTimeoutMs)
{
    QSqlDatabase db;
    if (QSqlDatabase::contains(connectionName)) {
        db = QSqlDatabase::database(connectionName, false);
    } else {
        db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
    }

    db.setDatabaseName(databasePath);
    db.setConnectOptions(QString("QSQLITE_BUSY_TIMEOUT=%1").arg(busyTimeoutMs));

    if (!db.isOpen() && !db.open()) {
        qCritical() << "DbManager: Cannot open database:" << db.lastError().text();
        qCritical() << "DbManager: Database path:" << databasePath;
        return db;
    }

    if (!enableForeignKeys(db)) {
        qCritical() << "DbManager: Cannot enable foreign keys on" << connectionName;
        db.close();
        return db;
    }

    if (databasePath != ":memory:" && !enableWriteAheadLog(db)) {
        qWarning() << "DbManager: WAL journal not enabled on" << connectionName;
    }

    qDebug() << "DbManager: Connection" << connectionName << "ready";
    return db;
}

void DbManager::closeConnection(const QString &connectionName)
{
    if (!QSqlDatabase::contains(connectionName)) {
        return;
    }
    {
        QSqlDatabase db = QSqlDatabase::database(connectionName, false);
        if (db.isOpen()) {
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);
}

bool DbManager::enableForeignKeys(QSqlDatabase &db)
{
    QSqlQuery query(db);
    if (!query.exec("PRAGMA foreign_keys = ON")) {
        qCritical() << "DbManager: Cannot enable foreign keys:" << query.lastError().text();
        return false;
    }

    if (query.exec("PRAGMA foreign_keys")) {
        if (query.next()) {
            const int fkEnabled = query.value(0).toInt();
            if (fkEnabled == 1) {
                qDebug() << "DbManager: Foreign keys enabled";
                return true;
            }
        }
    }

    qWarning() << "DbManager: Foreign keys check failed";
    return false;
}

bool DbManager::enableWriteAheadLog(QSqlDatabase &db)
{
    QSqlQuery query(db);
    if (!query.exec("PRAGMA journal_mode = WAL")) {
        qWarning() << "DbManager: Cannot switch journal mode:" << query.lastError().text();
        return false;
    }
    return query.next() && query.value(0).toString().compare("wal", Qt::CaseInsensitive) == 0;
}
