#pragma once

#include "sysscope/report_export.hpp"
#include "sysscope/scan_worker.hpp"
#include "sysscope/slots.hpp"

#include <QObject>
#include <QPointer>
#include <QString>
#include <QThread>
#include <QVector>

#include <array>

namespace sysscope {

// Owns the report slots and the scan state machine. Lives on the GUI
// thread; each scan runs on its own QThread.
class ScanController : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Running,
        Done,
        Failed,
    };
    Q_ENUM(State)

    ScanController(ScanJob job, QString exportDirectory, QObject* parent = nullptr);
    // Waits for a running scan.
    ~ScanController() override;

    State state() const { return state_; }
    QString statusText() const { return status_; }
    // "idle", "running", "done" or "error"; export failures also read "error".
    QString statusTone() const { return tone_; }

    QString slotText(Slot slot) const;
    QVector<ReportSection> sections() const;

public slots:
    // Returns false when a scan is already running.
    bool startScan();
    // Returns the written path, or an empty string on failure.
    QString exportReport();

signals:
    void slotsCleared();
    void slotChanged(sysscope::Slot slot, const QString& text);
    void stateChanged(sysscope::ScanController::State state);
    void statusChanged(const QString& text);

private slots:
    void onSectionReady(sysscope::Slot slot, const QString& text);
    void onFinished();
    void onFailed(const QString& message);

private:
    void setState(State state, const QString& status);
    void setStatus(const QString& status, const QString& tone);

    ScanJob job_;
    QString exportDirectory_;
    State state_ = State::Idle;
    QString status_;
    QString tone_;
    std::array<QString, kAllSlots.size()> texts_;
    QPointer<QThread> thread_;
};

} // namespace sysscope
