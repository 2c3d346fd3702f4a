#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "sysscope/config.hpp"
#include "sysscope/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testCategoriesWriteToFile();
    void testRotation();
    void testConfigFromEnvironment();

private:
    QTemporaryDir m_tempDir;
    QString m_logPath;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_logPath = m_tempDir.path() + "/logs/sysscope.log";

    sysscope::Config config;
    config.logFile = m_logPath.toStdString();
    config.debugLogging = true;
    sysscope::logging::initLogging(config);
}

void LoggingTests::cleanupTestCase()
{
    qInstallMessageHandler(nullptr);
}

void LoggingTests::testCategoriesWriteToFile()
{
    QCOMPARE(sysscope::logging::logFilePath(), m_logPath);

    qCInfo(lcExport) << "wrote report";
    qCDebug(lcCollect) << "strategy failed";

    QFile file(m_logPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    QVERIFY(contents.contains(" INFO sysscope.export: wrote report"));
    QVERIFY(contents.contains(" DEBUG sysscope.collect: strategy failed"));
}

void LoggingTests::testRotation()
{
    {
        QFile file(m_logPath);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        QVERIFY(file.write(QByteArray(5 * 1024 * 1024, 'x')) == 5 * 1024 * 1024);
    }

    qCWarning(lcScan) << "after rotation";

    QVERIFY(QFile::exists(m_logPath + ".1"));
    QFile file(m_logPath);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    QVERIFY(contents.size() < 1024);
    QVERIFY(contents.contains(" WARN sysscope.scan: after rotation"));
}

void LoggingTests::testConfigFromEnvironment()
{
    qputenv("SYSSCOPE_PROC_ROOT", "/tmp/fake-proc");
    qputenv("SYSSCOPE_EXPORT_DIR", "/tmp/reports");
    qputenv("SYSSCOPE_CPU_SAMPLE_MS", "250");
    qputenv("SYSSCOPE_DEBUG", "1");
    qunsetenv("SYSSCOPE_SYS_ROOT");

    const sysscope::Config config = sysscope::Config::fromEnvironment();
    QCOMPARE(QString::fromStdString(config.procRoot), QStringLiteral("/tmp/fake-proc"));
    QCOMPARE(QString::fromStdString(config.sysRoot), QStringLiteral("/sys"));
    QCOMPARE(QString::fromStdString(config.exportDirectory), QStringLiteral("/tmp/reports"));
    QCOMPARE(config.cpuSampleMs, 250);
    QCOMPARE(config.toolTimeoutMs, 5000);
    QCOMPARE(config.shellTimeoutMs, 10000);
    QVERIFY(config.debugLogging);

    qputenv("SYSSCOPE_CPU_SAMPLE_MS", "-5");
    QCOMPARE(sysscope::Config::fromEnvironment().cpuSampleMs, 1000);

    qunsetenv("SYSSCOPE_PROC_ROOT");
    qunsetenv("SYSSCOPE_EXPORT_DIR");
    qunsetenv("SYSSCOPE_CPU_SAMPLE_MS");
    qunsetenv("SYSSCOPE_DEBUG");
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
