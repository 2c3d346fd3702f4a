#include "sysscope/main_window.hpp"

#include <QFontDatabase>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QStyle>
#include <QTabWidget>
#include <QVBoxLayout>
#include <QWidget>

namespace sysscope {

MainWindow::MainWindow(ScanController* controller, QWidget* parent)
    : QMainWindow(parent),
      controller_(controller) {
    setWindowTitle("SysScope");
    resize(1100, 760);

    auto* central = new QWidget(this);
    auto* rootLayout = new QVBoxLayout(central);
    rootLayout->setContentsMargins(16, 16, 16, 12);
    rootLayout->setSpacing(12);

    auto* topBar = new QHBoxLayout();
    auto* title = new QLabel("SysScope Hardware Inventory", central);
    title->setObjectName("titleLabel");

    scanButton_ = new QPushButton("Scan System", central);
    scanButton_->setObjectName("scanButton");
    exportButton_ = new QPushButton("Export to Text", central);
    exportButton_->setObjectName("exportButton");
    topBar->addWidget(title);
    topBar->addStretch(1);
    topBar->addWidget(scanButton_);
    topBar->addWidget(exportButton_);

    tabs_ = new QTabWidget(central);
    for (Slot slot : kAllSlots) {
        tabs_->addTab(buildSlotTab(slot), QString::fromStdString(slotLabel(slot)));
    }

    statusLabel_ = new QLabel(central);
    statusLabel_->setObjectName("statusLabel");

    rootLayout->addLayout(topBar);
    rootLayout->addWidget(tabs_, 1);
    rootLayout->addWidget(statusLabel_);
    setCentralWidget(central);

    connect(scanButton_, &QPushButton::clicked, controller_, &ScanController::startScan);
    connect(exportButton_, &QPushButton::clicked, controller_, &ScanController::exportReport);
    connect(controller_, &ScanController::slotsCleared, this, &MainWindow::clearSlots);
    connect(controller_, &ScanController::slotChanged, this, &MainWindow::showSlot);
    connect(controller_, &ScanController::stateChanged, this, &MainWindow::updateState);
    connect(controller_, &ScanController::statusChanged, this, &MainWindow::updateStatus);

    applyTheme();
    updateState(controller_->state());
    updateStatus(controller_->statusText());
}

QWidget* MainWindow::buildSlotTab(Slot slot) {
    auto* page = new QWidget(tabs_);
    auto* layout = new QVBoxLayout(page);

    auto* view = new QPlainTextEdit(page);
    view->setReadOnly(true);
    view->setLineWrapMode(QPlainTextEdit::NoWrap);
    view->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    view->setPlainText(controller_->slotText(slot));
    layout->addWidget(view);

    views_[static_cast<std::size_t>(slot)] = view;
    return page;
}

void MainWindow::clearSlots() {
    for (auto* view : views_) {
        view->clear();
    }
}

void MainWindow::showSlot(sysscope::Slot slot, const QString& text) {
    views_[static_cast<std::size_t>(slot)]->setPlainText(text);
}

void MainWindow::updateState(sysscope::ScanController::State state) {
    // Export stays available while a scan runs.
    scanButton_->setEnabled(state != ScanController::State::Running);
}

void MainWindow::updateStatus(const QString& text) {
    statusLabel_->setText(text);
    statusLabel_->setProperty("tone", controller_->statusTone());
    // Dynamic properties only restyle after a re-polish.
    statusLabel_->style()->unpolish(statusLabel_);
    statusLabel_->style()->polish(statusLabel_);
}

void MainWindow::applyTheme() {
    setStyleSheet(
        "QMainWindow {"
        "  background: #ffffff;"
        "  color: #000000;"
        "}"
        "QWidget {"
        "  color: #000000;"
        "}"
        "QLabel {"
        "  border: none;"
        "  background: transparent;"
        "}"
        "QTabWidget::pane {"
        "  border: 2px solid #000000;"
        "  background: #ffffff;"
        "  border-radius: 10px;"
        "}"
        "QTabBar::tab {"
        "  background: #f5f5f5;"
        "  color: #000000;"
        "  border: 2px solid #000000;"
        "  padding: 8px 14px;"
        "  margin-right: 4px;"
        "  border-top-left-radius: 8px;"
        "  border-top-right-radius: 8px;"
        "}"
        "QTabBar::tab:selected {"
        "  background: #ffffff;"
        "}"
        "QPushButton {"
        "  background: #ffffff;"
        "  color: #000000;"
        "  border: 2px solid #000000;"
        "  border-radius: 8px;"
        "  padding: 8px 14px;"
        "  font-weight: 400;"
        "}"
        "QPushButton:hover {"
        "  background: #efefef;"
        "}"
        "QPushButton:pressed {"
        "  background: #dcdcdc;"
        "}"
        "QPushButton:disabled {"
        "  color: #8a8a8a;"
        "  border-color: #8a8a8a;"
        "}"
        "QPlainTextEdit {"
        "  background: #ffffff;"
        "  border: none;"
        "  color: #000000;"
        "}"
        "QLabel#titleLabel {"
        "  font-size: 24px;"
        "  font-weight: 400;"
        "  color: #000000;"
        "}"
        "QLabel#statusLabel {"
        "  color: #000000;"
        "}"
        "QLabel#statusLabel[tone=\"running\"] {"
        "  color: #b36b00;"
        "}"
        "QLabel#statusLabel[tone=\"done\"] {"
        "  color: #1e7b34;"
        "}"
        "QLabel#statusLabel[tone=\"error\"] {"
        "  color: #c62828;"
        "}"
    );
}

} // namespace sysscope
