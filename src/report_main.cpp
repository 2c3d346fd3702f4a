#include "sysscope/collector.hpp"
#include "sysscope/config.hpp"
#include "sysscope/logging.hpp"
#include "sysscope/platform_provider.hpp"
#include "sysscope/report_export.hpp"

#include <QCoreApplication>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sysscope-report");

    const sysscope::Config config = sysscope::Config::fromEnvironment();
    sysscope::logging::initLogging(config);

    try {
        const auto provider = sysscope::makePlatformProvider(config);
        const sysscope::Collector collector(config, *provider);

        QVector<sysscope::ReportSection> sections;
        for (const auto& result : collector.scanAll()) {
            sections.push_back({QString::fromStdString(sysscope::slotLabel(result.slot)),
                                QString::fromStdString(result.text)});
        }
        std::cout << sysscope::formatReport(sections).toStdString();
    } catch (const std::exception& e) {
        std::cerr << "sysscope-report error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
