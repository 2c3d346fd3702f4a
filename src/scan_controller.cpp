#include "sysscope/scan_controller.hpp"

#include "sysscope/logging.hpp"

#include <QDateTime>
#include <QDir>

#include <exception>
#include <utility>

namespace sysscope {

ScanController::ScanController(ScanJob job, QString exportDirectory, QObject* parent)
    : QObject(parent),
      job_(std::move(job)),
      exportDirectory_(std::move(exportDirectory)) {
    qRegisterMetaType<sysscope::Slot>("sysscope::Slot");
    qRegisterMetaType<sysscope::ScanController::State>("sysscope::ScanController::State");
    setState(State::Idle, QStringLiteral("Ready to scan"));
}

ScanController::~ScanController() {
    if (thread_) {
        thread_->quit();
        thread_->wait();
        delete thread_.data();
    }
}

QString ScanController::slotText(Slot slot) const {
    return texts_[static_cast<std::size_t>(slot)];
}

QVector<ReportSection> ScanController::sections() const {
    QVector<ReportSection> sections;
    for (Slot slot : kAllSlots) {
        sections.push_back({QString::fromStdString(slotLabel(slot)), slotText(slot)});
    }
    return sections;
}

bool ScanController::startScan() {
    if (state_ == State::Running) {
        qCDebug(lcScan) << "scan already running, request ignored";
        return false;
    }

    for (auto& text : texts_) {
        text.clear();
    }
    emit slotsCleared();
    setState(State::Running, QStringLiteral("Scanning system..."));

    auto* thread = new QThread;
    auto* worker = new ScanWorker(job_);
    worker->moveToThread(thread);

    connect(thread, &QThread::started, worker, &ScanWorker::run);
    connect(worker, &ScanWorker::sectionReady, this, &ScanController::onSectionReady);
    connect(worker, &ScanWorker::finished, this, &ScanController::onFinished);
    connect(worker, &ScanWorker::failed, this, &ScanController::onFailed);
    connect(worker, &ScanWorker::finished, thread, &QThread::quit);
    connect(worker, &ScanWorker::failed, thread, &QThread::quit);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    thread_ = thread;
    qCInfo(lcScan) << "scan started";
    thread->start();
    return true;
}

QString ScanController::exportReport() {
    const QString path = QDir::cleanPath(QDir(exportDirectory_).filePath(exportFileName(QDateTime::currentDateTime())));
    try {
        writeReport(path, sections());
    } catch (const std::exception& e) {
        qCWarning(lcExport) << "export to" << path << "failed:" << e.what();
        setStatus(QStringLiteral("Export failed: %1").arg(QString::fromUtf8(e.what())), QStringLiteral("error"));
        return {};
    }

    setStatus(QStringLiteral("Exported to %1").arg(path), QStringLiteral("done"));
    return path;
}

void ScanController::onSectionReady(sysscope::Slot slot, const QString& text) {
    texts_[static_cast<std::size_t>(slot)] = text;
    emit slotChanged(slot, text);
}

void ScanController::onFinished() {
    qCInfo(lcScan) << "scan complete";
    setState(State::Done, QStringLiteral("Scan complete!"));
}

void ScanController::onFailed(const QString& message) {
    setState(State::Failed, QStringLiteral("Error during scan: %1").arg(message));
}

void ScanController::setState(State state, const QString& status) {
    static const char* const tones[] = {"idle", "running", "done", "error"};
    const bool changed = state != state_;
    state_ = state;
    setStatus(status, QString::fromLatin1(tones[static_cast<int>(state)]));
    if (changed) {
        emit stateChanged(state_);
    }
}

void ScanController::setStatus(const QString& status, const QString& tone) {
    status_ = status;
    tone_ = tone;
    emit statusChanged(status_);
}

} // namespace sysscope
