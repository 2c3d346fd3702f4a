#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "sysscope/config.hpp"
#include "sysscope/host_probe.hpp"

#include <stdexcept>

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

class HostProbeTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testCpuTimes();
    void testCpuTopologyAndFrequency();
    void testCpuFrequencyFromCpuinfo();
    void testCpuUsageFromStat();
    void testMissingProcfs();
    void testMemoryFromMeminfo();
    void testBootTimeAndDistro();
    void testPartitions();
    void testDiskIo();
    void testHwmonTemperatures();
    void testBatteryDischarging();
    void testBatteryPluggedIn();
    void testUnreadableBattery();
    void testNoPowerSupplyClass();

private:
    sysscope::Config makeConfig() const;

    QScopedPointer<QTemporaryDir> tempDir_;
};

void HostProbeTests::init()
{
    tempDir_.reset(new QTemporaryDir);
    QVERIFY(tempDir_->isValid());
    QVERIFY(QDir().mkpath(tempDir_->path() + "/proc"));
    QVERIFY(QDir().mkpath(tempDir_->path() + "/sys"));
}

sysscope::Config HostProbeTests::makeConfig() const
{
    sysscope::Config config;
    config.procRoot = (tempDir_->path() + "/proc").toStdString();
    config.sysRoot = (tempDir_->path() + "/sys").toStdString();
    config.osReleasePath = (tempDir_->path() + "/os-release").toStdString();
    config.cpuSampleMs = 10;
    return config;
}

void HostProbeTests::testCpuTimes()
{
    const std::string before =
        "cpu  100 0 100 800 0 0 0 0 0 0\n"
        "cpu0 50 0 50 400 0 0 0 0 0 0\n"
        "cpu1 50 0 50 400 0 0 0 0 0 0\n"
        "intr 12345\n";
    const std::string after =
        "cpu  200 0 200 1000 0 0 0 0 0 0\n"
        "cpu0 150 0 150 400 0 0 0 0 0 0\n"
        "cpu1 50 0 50 600 0 0 0 0 0 0\n";

    const auto first = sysscope::procfs::parseCpuTimes(before);
    QCOMPARE(first.size(), std::size_t(3));
    QCOMPARE(first[0].total, std::uint64_t(1000));
    QCOMPARE(first[0].busy, std::uint64_t(200));

    const auto usage = sysscope::procfs::usageBetween(first, sysscope::procfs::parseCpuTimes(after));
    QCOMPARE(usage.size(), std::size_t(3));
    QCOMPARE(usage[0], 50.0);
    QCOMPARE(usage[1], 100.0);
    QCOMPARE(usage[2], 0.0);

    // Identical samples have no elapsed time at all.
    const auto idle = sysscope::procfs::usageBetween(first, first);
    QCOMPARE(idle[0], 0.0);
}

void HostProbeTests::testCpuTopologyAndFrequency()
{
    QByteArray cpuinfo;
    for (int processor = 0; processor < 4; ++processor) {
        cpuinfo += "processor\t: " + QByteArray::number(processor) + "\n";
        cpuinfo += "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n";
        cpuinfo += "physical id\t: 0\n";
        cpuinfo += "core id\t\t: " + QByteArray::number(processor % 2) + "\n";
        cpuinfo += "cpu cores\t: 2\n";
        cpuinfo += "cpu MHz\t\t: 1800.000\n\n";
    }
    QVERIFY(writeFile(tempDir_->path() + "/proc/cpuinfo", cpuinfo));

    const QString cpufreq = tempDir_->path() + "/sys/devices/system/cpu/cpu0/cpufreq/";
    QVERIFY(writeFile(cpufreq + "scaling_cur_freq", "2400000\n"));
    QVERIFY(writeFile(cpufreq + "cpuinfo_min_freq", "400000\n"));
    QVERIFY(writeFile(cpufreq + "cpuinfo_max_freq", "3400000\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto cpu = probe.cpu();
    QCOMPARE(QString::fromStdString(cpu.model), QStringLiteral("Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz"));
    QCOMPARE(cpu.logicalThreads, 4u);
    QCOMPARE(cpu.physicalCores, 2u);
    QVERIFY(cpu.frequency.has_value());
    QCOMPARE(cpu.frequency->currentMHz, 2400.0);
    QCOMPARE(cpu.frequency->minMHz, 400.0);
    QCOMPARE(cpu.frequency->maxMHz, 3400.0);
}

void HostProbeTests::testCpuFrequencyFromCpuinfo()
{
    QVERIFY(writeFile(tempDir_->path() + "/proc/cpuinfo",
                      "processor\t: 0\ncpu MHz\t\t: 2112.004\ncpu cores\t: 1\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto cpu = probe.cpu();
    QVERIFY(cpu.frequency.has_value());
    QCOMPARE(cpu.frequency->currentMHz, 2112.004);
    QCOMPARE(cpu.frequency->maxMHz, 0.0);
    QCOMPARE(cpu.physicalCores, 1u);
    QVERIFY(!probe.cpuModelName().has_value());
}

void HostProbeTests::testCpuUsageFromStat()
{
    QVERIFY(writeFile(tempDir_->path() + "/proc/stat",
                      "cpu  10 0 10 80 0 0 0 0\ncpu0 5 0 5 40 0 0 0 0\ncpu1 5 0 5 40 0 0 0 0\nbtime 1700000000\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto usage = probe.sampleCpuUsage();
    QVERIFY(usage.has_value());
    QCOMPARE(usage->perCore.size(), std::size_t(2));
    // The file does not change between samples.
    QCOMPARE(usage->total, 0.0);
}

void HostProbeTests::testMissingProcfs()
{
    sysscope::HostProbe probe(makeConfig());
    QVERIFY(!probe.sampleCpuUsage().has_value());
    QVERIFY(!probe.cpu().frequency.has_value());
    QVERIFY(!probe.cpuModelName().has_value());
    QVERIFY(probe.partitions().empty());
    QVERIFY(!probe.diskIo().has_value());
    QVERIFY(!probe.temperatures().has_value());
}

void HostProbeTests::testMemoryFromMeminfo()
{
    QVERIFY(writeFile(tempDir_->path() + "/proc/meminfo",
                      "MemTotal:       16000000 kB\n"
                      "MemFree:         2000000 kB\n"
                      "MemAvailable:    9000000 kB\n"
                      "Buffers:          500000 kB\n"
                      "Cached:          5000000 kB\n"
                      "SReclaimable:     500000 kB\n"
                      "SwapTotal:       4000000 kB\n"
                      "SwapFree:        3000000 kB\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto memory = probe.memory();
    QCOMPARE(memory.total, std::uint64_t(16000000) * 1024);
    QCOMPARE(memory.available, std::uint64_t(9000000) * 1024);
    QCOMPARE(memory.free, std::uint64_t(2000000) * 1024);
    QCOMPARE(memory.used, std::uint64_t(8000000) * 1024);
    QCOMPARE(memory.swapTotal, std::uint64_t(4000000) * 1024);
    QCOMPARE(memory.swapUsed, std::uint64_t(1000000) * 1024);
    QCOMPARE(memory.swapFree, std::uint64_t(3000000) * 1024);
}

void HostProbeTests::testBootTimeAndDistro()
{
    QVERIFY(writeFile(tempDir_->path() + "/proc/stat", "cpu  1 2 3 4\nbtime 1700000000\n"));
    QVERIFY(writeFile(tempDir_->path() + "/os-release", "NAME=\"Fedora Linux\"\nPRETTY_NAME=\"Fedora Linux 40 (Workstation Edition)\"\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto os = probe.os();
    QCOMPARE(os.bootTime, std::int64_t(1700000000));
    QCOMPARE(QString::fromStdString(os.distro), QStringLiteral("Fedora Linux 40 (Workstation Edition)"));
    QVERIFY(!os.system.empty());
    QVERIFY(!os.machine.empty());
}

void HostProbeTests::testPartitions()
{
    const QString mounted = tempDir_->path() + "/data dir";
    QVERIFY(QDir().mkpath(mounted));
    QByteArray escaped = mounted.toUtf8();
    escaped.replace(" ", "\\040");

    const QByteArray mounts =
        "sysfs /sys sysfs rw,nosuid 0 0\n"
        "tmpfs /run tmpfs rw 0 0\n"
        "/dev/sdb1 " + escaped + " ext4 rw,relatime 0 0\n"
        "/dev/sdb1 " + escaped + " ext4 rw,relatime 0 0\n"
        "/dev/sdc1 /definitely/not/mounted/here xfs rw 0 0\n"
        "server:/export /mnt/nfs nfs4 rw 0 0\n";
    QVERIFY(writeFile(tempDir_->path() + "/proc/mounts", mounts));

    sysscope::HostProbe probe(makeConfig());
    const auto partitions = probe.partitions();
    QCOMPARE(partitions.size(), std::size_t(2));

    const auto &missing = partitions[0].device == "/dev/sdc1" ? partitions[0] : partitions[1];
    const auto &present = partitions[0].device == "/dev/sdb1" ? partitions[0] : partitions[1];
    QCOMPARE(QString::fromStdString(missing.device), QStringLiteral("/dev/sdc1"));
    QVERIFY(!missing.usage.has_value());

    QCOMPARE(QString::fromStdString(present.device), QStringLiteral("/dev/sdb1"));
    QCOMPARE(QString::fromStdString(present.mountPoint), mounted);
    QCOMPARE(QString::fromStdString(present.filesystem), QStringLiteral("ext4"));
    QVERIFY(present.usage.has_value());
    QVERIFY(present.usage->total > 0);
}

void HostProbeTests::testDiskIo()
{
    QVERIFY(writeFile(tempDir_->path() + "/proc/diskstats",
                      "   8       0 sda 100 0 2000 0 50 0 4000 0 0 0 0\n"
                      "   8       1 sda1 90 0 1800 0 40 0 3600 0 0 0 0\n"
                      "   7       0 loop0 5 0 10 0 0 0 0 0 0 0 0\n"));
    QVERIFY(QDir().mkpath(tempDir_->path() + "/sys/block/sda"));

    sysscope::HostProbe probe(makeConfig());
    const auto io = probe.diskIo();
    QVERIFY(io.has_value());
    QCOMPARE(io->readBytes, std::uint64_t(2000) * 512);
    QCOMPARE(io->writtenBytes, std::uint64_t(4000) * 512);
}

void HostProbeTests::testHwmonTemperatures()
{
    const QString chip = tempDir_->path() + "/sys/class/hwmon/hwmon0/";
    QVERIFY(writeFile(chip + "name", "coretemp\n"));
    QVERIFY(writeFile(chip + "temp2_input", "51000\n"));
    QVERIFY(writeFile(chip + "temp2_label", "Core 0\n"));
    QVERIFY(writeFile(chip + "temp10_input", "49500\n"));
    QVERIFY(writeFile(chip + "temp1_input", "53000\n"));
    QVERIFY(writeFile(chip + "temp1_label", "Package id 0\n"));
    QVERIFY(writeFile(chip + "temp1_max", "80000\n"));
    QVERIFY(writeFile(chip + "temp1_crit", "100000\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto readings = probe.temperatures();
    QVERIFY(readings.has_value());
    QCOMPARE(readings->size(), std::size_t(3));

    QCOMPARE(QString::fromStdString((*readings)[0].label), QStringLiteral("Package id 0"));
    QCOMPARE((*readings)[0].currentC, 53.0);
    QCOMPARE(*(*readings)[0].highC, 80.0);
    QCOMPARE(*(*readings)[0].criticalC, 100.0);
    QCOMPARE(QString::fromStdString((*readings)[1].label), QStringLiteral("Core 0"));
    QVERIFY(!(*readings)[1].highC.has_value());
    QCOMPARE((*readings)[2].currentC, 49.5);
    QCOMPARE(QString::fromStdString((*readings)[2].chip), QStringLiteral("coretemp"));
}

void HostProbeTests::testBatteryDischarging()
{
    const QString supplies = tempDir_->path() + "/sys/class/power_supply/";
    QVERIFY(writeFile(supplies + "AC/type", "Mains\n"));
    QVERIFY(writeFile(supplies + "AC/online", "0\n"));
    QVERIFY(writeFile(supplies + "BAT0/type", "Battery\n"));
    QVERIFY(writeFile(supplies + "BAT0/capacity", "76\n"));
    QVERIFY(writeFile(supplies + "BAT0/status", "Discharging\n"));
    QVERIFY(writeFile(supplies + "BAT0/energy_now", "30000000\n"));
    QVERIFY(writeFile(supplies + "BAT0/power_now", "10000000\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto battery = probe.battery();
    QVERIFY(battery.has_value());
    QCOMPARE(battery->percent, 76.0);
    QVERIFY(!battery->powerPlugged);
    QVERIFY(battery->secondsLeft.has_value());
    QCOMPARE(*battery->secondsLeft, std::int64_t(3 * 3600));
}

void HostProbeTests::testBatteryPluggedIn()
{
    const QString supplies = tempDir_->path() + "/sys/class/power_supply/";
    QVERIFY(writeFile(supplies + "AC/type", "Mains\n"));
    QVERIFY(writeFile(supplies + "AC/online", "1\n"));
    QVERIFY(writeFile(supplies + "BAT1/type", "Battery\n"));
    QVERIFY(writeFile(supplies + "BAT1/capacity", "100\n"));
    QVERIFY(writeFile(supplies + "BAT1/status", "Full\n"));

    sysscope::HostProbe probe(makeConfig());
    const auto battery = probe.battery();
    QVERIFY(battery.has_value());
    QVERIFY(battery->powerPlugged);
    QVERIFY(!battery->secondsLeft.has_value());
}

void HostProbeTests::testUnreadableBattery()
{
    const QString supplies = tempDir_->path() + "/sys/class/power_supply/";
    QVERIFY(writeFile(supplies + "BAT0/type", "Battery\n"));

    sysscope::HostProbe probe(makeConfig());
    QVERIFY_EXCEPTION_THROWN(probe.battery(), std::runtime_error);
}

void HostProbeTests::testNoPowerSupplyClass()
{
    sysscope::HostProbe probe(makeConfig());
    QVERIFY(!probe.battery().has_value());

    QVERIFY(writeFile(tempDir_->path() + "/sys/class/power_supply/AC/type", "Mains\n"));
    QVERIFY(!probe.battery().has_value());
}

QTEST_MAIN(HostProbeTests)
#include "test_host_probe.moc"
