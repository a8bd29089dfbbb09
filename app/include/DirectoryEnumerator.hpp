#ifndef DIRECTORY_ENUMERATOR_HPP
#define DIRECTORY_ENUMERATOR_HPP

#include "ScanTypes.hpp"
#include "FileAttributeProvider.hpp"

#include <QFileInfoList>
#include <QString>
#include <vector>

// Lazy, single-pass depth-first walk of a directory tree.
//
// Symbolic links are never followed or yielded, so link cycles cannot
// occur. A directory that cannot be listed produces one error record and
// the walk moves on to its siblings. Entries of a directory are visited
// in name order, which makes repeated walks of an unchanged tree yield
// the same sequence.
class DirectoryEnumerator {
public:
    DirectoryEnumerator(const QString& root, const FileAttributeProvider& attributes);

    // Checks the root. False means the scan cannot proceed; the reason is
    // available from take_errors().
    bool open();

    // Next regular file, or false when the walk is exhausted.
    bool next(FileRecord& record);

    std::vector<ScanError> take_errors();

    qint64 entries_examined() const { return entries_examined_; }
    qint64 directories_visited() const { return directories_visited_; }
    bool root_failed() const { return root_failed_; }

private:
    bool load_directory(const QString& path);
    void record_unreadable(const QString& path, const QString& reason);

    QString root_;
    const FileAttributeProvider& attributes_;
    std::vector<QString> pending_dirs_;
    QFileInfoList current_files_;
    int current_index_ = 0;
    std::vector<ScanError> errors_;
    qint64 entries_examined_ = 0;
    qint64 directories_visited_ = 0;
    bool opened_ = false;
    bool root_failed_ = false;
};

#endif // DIRECTORY_ENUMERATOR_HPP
