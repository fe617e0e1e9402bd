#include "fileexporter.hpp"

#include <ctime>
#include <fstream>

#include "utils.hpp"

bool FileExporter::exportFiles(const std::vector<ClassifiedFile>& files,
                               const std::string& outputPath,
                               const std::string& format) {
    const std::string fmt = toLower(format);
    if (fmt != "csv" && fmt != "html")
        return false;

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;

    if (fmt == "csv") {
        writeCsv(files, out);
    } else {
        writeHtml(files, out);
    }

    out.flush();
    return static_cast<bool>(out);
}

std::string FileExporter::csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void FileExporter::writeCsv(const std::vector<ClassifiedFile>& files, std::ostream& out) {
    out << "Name,Size (bytes),Size,Category,Last Accessed,Path\r\n";

    for (const auto& item : files) {
        const FileInfo& fi = item.file;
        out << csvField(fi.getName()) << ','
            << fi.getFileSize() << ','
            << csvField(formatBytes(fi.getFileSize())) << ','
            << categoryName(item.category) << ','
            << formatDate(fi.getLastAccessed()) << ','
            << csvField(fi.getPath()) << "\r\n";
    }
}

std::string FileExporter::htmlEscape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

void FileExporter::writeHtml(const std::vector<ClassifiedFile>& files, std::ostream& out) {
    long long totalSize = 0;
    for (const auto& item : files) {
        totalSize += item.file.getFileSize();
    }

    out << "<!DOCTYPE html>\n"
           "<html>\n<head>\n"
           "    <meta charset=\"UTF-8\">\n"
           "    <title>Disk Space Analysis Report</title>\n"
           "    <style>\n"
           "        body { font-family: Arial, sans-serif; margin: 20px; }\n"
           "        table { border-collapse: collapse; width: 100%; margin-top: 20px; }\n"
           "        th, td { border: 1px solid #ddd; padding: 8px; text-align: left; }\n"
           "        th { background-color: #4a90d9; color: white; }\n"
           "        tr:nth-child(even) { background-color: #f9f9f9; }\n"
           "        .size { text-align: right; }\n"
           "        .stats { background: #f5f5f5; padding: 15px; margin-bottom: 20px; }\n"
           "    </style>\n"
           "</head>\n<body>\n"
           "    <h1>Disk Space Analysis Report</h1>\n"
           "    <div class=\"stats\">\n"
        << "        <p><strong>Generated:</strong> " << formatDate(std::time(nullptr)) << "</p>\n"
        << "        <p><strong>Total Files:</strong> " << files.size() << "</p>\n"
        << "        <p><strong>Total Size:</strong> " << formatBytes(totalSize) << "</p>\n"
        << "    </div>\n"
           "    <table>\n"
           "        <thead>\n"
           "            <tr><th>Name</th><th>Size</th><th>Category</th>"
           "<th>Last Accessed</th><th>Path</th></tr>\n"
           "        </thead>\n"
           "        <tbody>\n";

    for (const auto& item : files) {
        const FileInfo& fi = item.file;
        out << "            <tr><td>" << htmlEscape(fi.getName()) << "</td>"
            << "<td class=\"size\">" << formatBytes(fi.getFileSize()) << "</td>"
            << "<td>" << categoryName(item.category) << "</td>"
            << "<td>" << formatDate(fi.getLastAccessed()) << "</td>"
            << "<td>" << htmlEscape(fi.getPath()) << "</td></tr>\n";
    }

    out << "        </tbody>\n"
           "    </table>\n"
           "</body>\n</html>\n";
}
