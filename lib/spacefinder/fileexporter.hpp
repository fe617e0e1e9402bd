#ifndef FILEEXPORTER_HPP
#define FILEEXPORTER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "classifiedfile.hpp"

/**
 * @brief Writes analyzed file lists as CSV or HTML reports
 *
 * Columns: Name, Size (bytes), Size, Category, Last Accessed, Path.
 */
class FileExporter {
public:
    /**
     * @brief Exports @p files to @p outputPath
     *
     * @param format "csv" or "html", case-insensitive
     * @return false for an unknown format or if the file cannot be written
     */
    static bool exportFiles(const std::vector<ClassifiedFile>& files,
                            const std::string& outputPath,
                            const std::string& format);

    static void writeCsv(const std::vector<ClassifiedFile>& files, std::ostream& out);
    static void writeHtml(const std::vector<ClassifiedFile>& files, std::ostream& out);

    /** @brief Quotes a CSV field if it contains ',', '"' or a line break */
    static std::string csvField(const std::string& value);

    static std::string htmlEscape(const std::string& value);
};

#endif // FILEEXPORTER_HPP
