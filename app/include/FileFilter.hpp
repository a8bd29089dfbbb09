#ifndef FILE_FILTER_HPP
#define FILE_FILTER_HPP

#include "ScanSettings.hpp"
#include "ScanTypes.hpp"

#include <QRegularExpression>
#include <vector>

// Decides whether an enumerated file takes part in the scan.
// Rejections are silent; the caller only counts them.
class FileFilter {
public:
    explicit FileFilter(const FilterConfig& config);

    bool accepts(const FileRecord& record) const;

    // Cheap checks that need no size (name, attributes, patterns).
    bool accepts_name(const FileRecord& record) const;
    bool accepts_size(qint64 size) const;

    bool matches_exclusion(const QString& path) const;

private:
    FilterConfig config_;
    std::vector<QRegularExpression> exclusions_;
};

#endif // FILE_FILTER_HPP
