#include "CullSession.hpp"
#include "FileMover.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFileInfo>

CullSession::CullSession(QObject* parent)
    : QObject(parent)
    , current_index_(0)
    , state_(SessionState::Idle)
    , kept_count_(0)
    , rejected_count_(0)
    , skipped_count_(0)
    , unreadable_count_(0) {
}

CullSession::~CullSession() = default;

void CullSession::reset() {
    records_.clear();
    skipped_directories_.clear();
    current_index_ = 0;
    state_ = SessionState::Idle;
    kept_count_ = 0;
    rejected_count_ = 0;
    skipped_count_ = 0;
    unreadable_count_ = 0;
}

StartResult CullSession::start(const QString& source_dir, const QString& keep_dir, bool recursive) {
    reset();
    StartResult result;

    if (source_dir.isEmpty() || keep_dir.isEmpty()) {
        result.error_message = "Select both a source folder and a keep folder first.";
        return result;
    }
    if (!QFileInfo(source_dir).isDir()) {
        result.error_message = "Source folder not found. Did you move it?";
        LOG_ERROR("Session", QString("Source folder missing: %1").arg(source_dir));
        return result;
    }

    source_dir_ = source_dir;
    keep_dir_ = keep_dir;
    reject_dir_ = QDir(source_dir).filePath(ImageScanner::kRejectsFolderName);
    if (!QDir().mkpath(reject_dir_)) {
        result.error_message = QString("Could not create reject folder:\n%1").arg(reject_dir_);
        LOG_ERROR("Session", result.error_message);
        return result;
    }

    ScanResult scan = ImageScanner::scan(source_dir, recursive);
    if (!scan.success()) {
        result.error_message = scan.error;
        return result;
    }
    skipped_directories_ = scan.skipped_directories;

    if (scan.records.empty()) {
        result.no_images = true;
        result.error_message = "No image files found in source folder.";
        LOG_INFO("Session", QString("Nothing to cull in %1").arg(source_dir));
        return result;
    }

    records_ = std::move(scan.records);
    current_index_ = 0;
    state_ = SessionState::Browsing;
    result.success = true;

    LOG_INFO("Session", QString("Culling %1 image(s) from %2 (keep: %3)")
             .arg(records_.size()).arg(source_dir, keep_dir));
    emit current_changed(current_index_, count());
    return result;
}

const ImageRecord* CullSession::current_record() const {
    if (state_ != SessionState::Browsing) return nullptr;
    if (current_index_ < 0 || current_index_ >= count()) return nullptr;
    return &records_[current_index_];
}

void CullSession::trigger(CullAction action) {
    switch (action) {
        case CullAction::Keep:     keep(); break;
        case CullAction::Reject:   reject(); break;
        case CullAction::Next:     next(); break;
        case CullAction::Previous: previous(); break;
        case CullAction::Skip:     skip(); break;
        case CullAction::Disabled: break;
    }
}

bool CullSession::move_current(const QString& destination, int& counter) {
    const ImageRecord* record = current_record();
    if (!record) return false;

    const MoveResult moved = FileMover::move_into(*record, destination);
    if (!moved.success) {
        emit move_failed(moved.error_message);
        return false;
    }

    ++counter;
    ++current_index_;
    if (current_index_ >= count()) {
        state_ = SessionState::Finished;
        LOG_INFO("Session", QString("Finished: %1").arg(summary_text()));
        emit finished();
    } else {
        emit current_changed(current_index_, count());
    }
    return true;
}

bool CullSession::keep() {
    return move_current(keep_dir_, kept_count_);
}

bool CullSession::reject() {
    return move_current(reject_dir_, rejected_count_);
}

void CullSession::next() {
    if (state_ != SessionState::Browsing || current_index_ >= count() - 1) return;
    ++current_index_;
    emit current_changed(current_index_, count());
}

void CullSession::previous() {
    if (state_ != SessionState::Browsing || current_index_ <= 0) return;
    --current_index_;
    emit current_changed(current_index_, count());
}

void CullSession::skip() {
    // Same as next() for now, but counted on its own
    if (state_ != SessionState::Browsing || current_index_ >= count() - 1) return;
    ++skipped_count_;
    next();
}

bool CullSession::mark_current_unreadable(const QString& reason) {
    const ImageRecord* record = current_record();
    if (!record) return false;
    LOG_WARN("Session", QString("Auto-rejecting unreadable image %1: %2")
             .arg(record->display_path(), reason));
    return move_current(reject_dir_, unreadable_count_);
}

QString CullSession::summary_text() const {
    QString text = QString("Kept %1, rejected %2, skipped %3")
        .arg(kept_count_).arg(rejected_count_).arg(skipped_count_);
    if (unreadable_count_ > 0) {
        text += QString(", unreadable %1").arg(unreadable_count_);
    }
    return text;
}
