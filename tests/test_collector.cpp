#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "sysscope/collector.hpp"
#include "sysscope/linux_provider.hpp"
#include "sysscope/platform_provider.hpp"
#include "sysscope/windows_provider.hpp"

#include <sys/utsname.h>

static bool writeFile(const QString &path, const QByteArray &data)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

// Every tool and sensor is absent: empty PATH, empty procfs and sysfs roots.
class CollectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testCpuMarkers();
    void testCpuModelChainExhausted();
    void testGpuMarker();
    void testLinuxMotherboardMarkers();
    void testWindowsMotherboardMarkers();
    void testOtherPlatformMotherboardMarker();
    void testUnreadableBattery();
    void testLinuxSysfsInventory();
    void testStorageWithoutMounts();
    void testScanAllFillsEverySlot();

private:
    sysscope::Config makeConfig() const;

    QByteArray savedPath_;
    QScopedPointer<QTemporaryDir> tempDir_;
};

void CollectorTests::initTestCase()
{
    savedPath_ = qgetenv("PATH");
    qputenv("PATH", QByteArray());
}

void CollectorTests::cleanupTestCase()
{
    qputenv("PATH", savedPath_);
}

void CollectorTests::init()
{
    tempDir_.reset(new QTemporaryDir);
    QVERIFY(tempDir_->isValid());
}

sysscope::Config CollectorTests::makeConfig() const
{
    sysscope::Config config;
    config.procRoot = (tempDir_->path() + "/proc").toStdString();
    config.sysRoot = (tempDir_->path() + "/sys").toStdString();
    config.osReleasePath = (tempDir_->path() + "/os-release").toStdString();
    config.cpuSampleMs = 10;
    return config;
}

void CollectorTests::testCpuMarkers()
{
    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const QString text = QString::fromStdString(collector.cpuReport());
    QVERIFY(text.contains("Frequency: unavailable\n"));
    QVERIFY(text.contains("CPU Usage: unavailable\n"));

    // Without cpuinfo or lscpu only the machine type is left.
    struct utsname uts {};
    QCOMPARE(uname(&uts), 0);
    QVERIFY(text.contains(QStringLiteral("Processor: %1\n").arg(QString::fromUtf8(uts.machine))));
}

void CollectorTests::testCpuModelChainExhausted()
{
    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    auto chain = collector.cpuModelChain();
    QCOMPARE(chain.size(), std::size_t(3));
    QCOMPARE(QString::fromStdString(chain[0].name), QStringLiteral("procfs"));
    QCOMPARE(QString::fromStdString(chain[1].name), QStringLiteral("linux"));
    QVERIFY(!chain[0].query().has_value());
    QVERIFY(!chain[1].query().has_value());

    chain.pop_back();
    QCOMPARE(QString::fromStdString(sysscope::firstAvailableOr(chain, std::string("Unknown CPU"))),
             QStringLiteral("Unknown CPU"));
}

void CollectorTests::testGpuMarker()
{
    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider linuxProvider(config);
    sysscope::WindowsPlatformProvider windowsProvider(config);
    sysscope::NullPlatformProvider nullProvider;

    for (const sysscope::PlatformProvider *provider : {static_cast<const sysscope::PlatformProvider *>(&linuxProvider),
                                                       static_cast<const sysscope::PlatformProvider *>(&windowsProvider),
                                                       static_cast<const sysscope::PlatformProvider *>(&nullProvider)}) {
        sysscope::Collector collector(config, *provider);
        const QString text = QString::fromStdString(collector.gpuReport());
        QVERIFY2(text.contains("No GPU detected"), provider->name().c_str());
    }
}

void CollectorTests::testLinuxMotherboardMarkers()
{
    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const QString text = QString::fromStdString(collector.motherboardReport());
    QVERIFY(!text.contains("HWMonitor"));
    QVERIFY(text.contains("Unavailable (may need root)\n"));
    QVERIFY(text.contains("BIOS information unavailable\n"));
    QVERIFY(text.contains("Temperature sensors not available.\n"));
    QVERIFY(text.contains("No battery (desktop system)\n"));
}

void CollectorTests::testWindowsMotherboardMarkers()
{
    const auto config = makeConfig();
    sysscope::WindowsPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const QString text = QString::fromStdString(collector.motherboardReport());
    QVERIFY(text.contains("Motherboard information unavailable\n"));
    QVERIFY(text.contains("BIOS information unavailable\n"));
    QVERIFY(text.contains("Temperature sensors not available.\n\n"
                          "Note: Windows does not expose temperature sensors through standard APIs.\n"));
    QVERIFY(text.contains("  - Open Hardware Monitor (https://openhardwaremonitor.org/)\n"));

    const QString memory = QString::fromStdString(collector.memoryReport());
    QVERIFY(memory.contains("RAM module details unavailable\n"));
}

void CollectorTests::testOtherPlatformMotherboardMarker()
{
    sysscope::NullPlatformProvider provider;
    sysscope::Collector collector(makeConfig(), provider);

    const QString text = QString::fromStdString(collector.motherboardReport());
    QVERIFY(text.contains("Not available on this platform\n"));
    QVERIFY(text.contains("BIOS information unavailable\n"));
}

void CollectorTests::testUnreadableBattery()
{
    QVERIFY(writeFile(tempDir_->path() + "/sys/class/power_supply/BAT0/type", "Battery\n"));

    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const QString text = QString::fromStdString(collector.motherboardReport());
    QVERIFY(text.contains("Battery info unavailable\n"));
}

void CollectorTests::testLinuxSysfsInventory()
{
    const QString sys = tempDir_->path() + "/sys";
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/board_vendor", "LENOVO\n"));
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/board_name", "20XWCTO1WW\n"));
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/board_version", "SDK0J40697 WIN\n"));
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/bios_vendor", "LENOVO\n"));
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/bios_version", "N32ET86W (1.62 )\n"));
    QVERIFY(writeFile(sys + "/devices/virtual/dmi/id/bios_date", "07/12/2023\n"));
    QVERIFY(writeFile(sys + "/class/thermal/thermal_zone0/type", "x86_pkg_temp\n"));
    QVERIFY(writeFile(sys + "/class/thermal/thermal_zone0/temp", "47000\n"));
    QVERIFY(writeFile(sys + "/class/drm/card0/device/vendor", "0x8086\n"));
    QVERIFY(writeFile(sys + "/class/drm/card0/device/device", "0x9a49\n"));
    QVERIFY(writeFile(sys + "/class/drm/card0-eDP-1/status", "connected\n"));
    QVERIFY(writeFile(sys + "/block/nvme0n1/size", "1000215216\n"));
    QVERIFY(writeFile(sys + "/block/nvme0n1/device/model", "WDC PC SN730 SDBQNTY-512G-1001\n"));
    QVERIFY(writeFile(sys + "/block/loop0/size", "8\n"));

    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const QString board = QString::fromStdString(collector.motherboardReport());
    QVERIFY(board.contains("Manufacturer: LENOVO\nModel: 20XWCTO1WW\nVersion: SDK0J40697 WIN\n"));
    QVERIFY(board.contains("Version: N32ET86W (1.62 )\n"));
    QVERIFY(board.contains("Release Date: 07/12/2023\n"));
    QVERIFY(board.contains("thermal:\n  x86_pkg_temp: 47.0°C\n"));

    const QString gpu = QString::fromStdString(collector.gpuReport());
    QVERIFY(gpu.contains("Detected GPU(s):"));
    QVERIFY(gpu.contains("Intel GPU [8086:9a49]\n"));
    QVERIFY(!gpu.contains("eDP"));

    const QString overview = QString::fromStdString(collector.componentsOverview());
    QVERIFY(overview.contains("└─ LENOVO 20XWCTO1WW\n"));
    QVERIFY(overview.contains("└─ WDC PC SN730 SDBQNTY-512G-1001 (476.94GB)\n"));
    QVERIFY(!overview.contains("loop0"));
}

void CollectorTests::testStorageWithoutMounts()
{
    const auto config = makeConfig();
    sysscope::NullPlatformProvider provider;
    sysscope::Collector collector(config, provider);

    const QString text = QString::fromStdString(collector.storageReport());
    QVERIFY(text.startsWith("STORAGE INFORMATION\n"));
    QVERIFY(text.contains("No mounted partitions detected\n"));
}

void CollectorTests::testScanAllFillsEverySlot()
{
    const auto config = makeConfig();
    sysscope::LinuxPlatformProvider provider(config);
    sysscope::Collector collector(config, provider);

    const auto results = collector.scanAll();
    QCOMPARE(results.size(), sysscope::kAllSlots.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        QVERIFY(results[i].slot == sysscope::kAllSlots[i]);
        QVERIFY2(!results[i].text.empty(), sysscope::slotLabel(results[i].slot).c_str());
    }

    QVERIFY(QString::fromStdString(results.front().text).startsWith("Scan Date: "));
    QVERIFY(QString::fromStdString(results.back().text).startsWith("OPERATING SYSTEM\n"));
}

QTEST_MAIN(CollectorTests)
#include "test_collector.moc"
