#ifndef CULL_SESSION_HPP
#define CULL_SESSION_HPP

#include "CullAction.hpp"
#include "ImageScanner.hpp"
#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>

enum class SessionState {
    Idle,       // nothing scanned yet (or the last scan found nothing)
    Browsing,   // current_index in [0, count)
    Finished    // every image was moved out; no further actions accepted
};

struct StartResult {
    bool success = false;
    bool no_images = false;     // scan worked but found nothing
    QString error_message;
};

// One culling run over a source folder. Keep/Reject move the current image
// and advance only when the move worked; Next/Previous/Skip only move the
// cursor. Everything is synchronous and runs on the GUI thread.
class CullSession : public QObject {
    Q_OBJECT

public:
    explicit CullSession(QObject* parent = nullptr);
    ~CullSession() override;

    // Creates <source>/_REJECTS, scans and positions on the first image
    StartResult start(const QString& source_dir, const QString& keep_dir, bool recursive);

    void trigger(CullAction action);

    bool keep();
    bool reject();
    void next();
    void previous();
    void skip();

    // The current image could not be decoded: reject it and move on
    bool mark_current_unreadable(const QString& reason);

    SessionState state() const { return state_; }
    int current_index() const { return current_index_; }
    int count() const { return static_cast<int>(records_.size()); }
    const std::vector<ImageRecord>& records() const { return records_; }

    // nullptr unless Browsing
    const ImageRecord* current_record() const;

    QString source_dir() const { return source_dir_; }
    QString keep_dir() const { return keep_dir_; }
    QString reject_dir() const { return reject_dir_; }
    QStringList skipped_directories() const { return skipped_directories_; }

    int kept_count() const { return kept_count_; }
    int rejected_count() const { return rejected_count_; }
    int skipped_count() const { return skipped_count_; }
    int unreadable_count() const { return unreadable_count_; }
    QString summary_text() const;

signals:
    void current_changed(int index, int total);
    void move_failed(const QString& message);
    void finished();

private:
    bool move_current(const QString& destination, int& counter);
    void reset();

    std::vector<ImageRecord> records_;
    int current_index_;
    SessionState state_;
    QString source_dir_;
    QString keep_dir_;
    QString reject_dir_;
    QStringList skipped_directories_;

    int kept_count_;
    int rejected_count_;
    int skipped_count_;
    int unreadable_count_;
};

#endif // CULL_SESSION_HPP
