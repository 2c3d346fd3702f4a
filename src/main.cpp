#include "sysscope/collector.hpp"
#include "sysscope/config.hpp"
#include "sysscope/logging.hpp"
#include "sysscope/main_window.hpp"
#include "sysscope/platform_provider.hpp"
#include "sysscope/scan_controller.hpp"

#include <QApplication>

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName("SysScope");

    const sysscope::Config config = sysscope::Config::fromEnvironment();
    sysscope::logging::initLogging(config);

    const auto provider = sysscope::makePlatformProvider(config);
    const sysscope::Collector collector(config, *provider);

    sysscope::ScanController controller(
        [&collector]() { return collector.scanAll(); },
        QString::fromStdString(config.exportDirectory));

    sysscope::MainWindow window(&controller);
    window.show();

    return app.exec();
}
