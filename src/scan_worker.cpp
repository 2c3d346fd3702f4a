#include "sysscope/scan_worker.hpp"

#include "sysscope/logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace sysscope {

ScanWorker::ScanWorker(ScanJob job, QObject* parent)
    : QObject(parent),
      job_(std::move(job)) {
}

void ScanWorker::run() {
    std::vector<SlotText> results;
    try {
        if (!job_) {
            throw std::runtime_error("no scan job configured");
        }
        results = job_();
    } catch (const std::exception& e) {
        qCWarning(lcScan) << "scan failed:" << e.what();
        emit failed(QString::fromUtf8(e.what()));
        return;
    }

    for (const auto& result : results) {
        emit sectionReady(result.slot, QString::fromStdString(result.text));
    }
    emit finished();
}

} // namespace sysscope
