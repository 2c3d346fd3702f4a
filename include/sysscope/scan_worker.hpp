#pragma once

#include "sysscope/slots.hpp"

#include <QMetaType>
#include <QObject>
#include <QString>

#include <functional>
#include <vector>

Q_DECLARE_METATYPE(sysscope::Slot)

namespace sysscope {

using ScanJob = std::function<std::vector<SlotText>()>;

// Runs one scan job on whatever thread it was moved to and reports the
// sections back through signals. Sections are only emitted once the whole
// job has returned.
class ScanWorker : public QObject {
    Q_OBJECT

public:
    explicit ScanWorker(ScanJob job, QObject* parent = nullptr);

public slots:
    void run();

signals:
    void sectionReady(sysscope::Slot slot, const QString& text);
    void finished();
    void failed(const QString& message);

private:
    ScanJob job_;
};

} // namespace sysscope
