#pragma once

#include "sysscope/scan_controller.hpp"
#include "sysscope/slots.hpp"

#include <QMainWindow>

#include <array>

class QLabel;
class QPlainTextEdit;
class QPushButton;
class QTabWidget;
class QWidget;

namespace sysscope {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(ScanController* controller, QWidget* parent = nullptr);

private slots:
    void clearSlots();
    void showSlot(sysscope::Slot slot, const QString& text);
    void updateState(sysscope::ScanController::State state);
    void updateStatus(const QString& text);

private:
    QWidget* buildSlotTab(Slot slot);
    void applyTheme();

    ScanController* controller_ = nullptr;

    QTabWidget* tabs_ = nullptr;
    std::array<QPlainTextEdit*, kAllSlots.size()> views_{};

    QLabel* statusLabel_ = nullptr;
    QPushButton* scanButton_ = nullptr;
    QPushButton* exportButton_ = nullptr;
};

} // namespace sysscope
