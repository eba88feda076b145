#include "fileio_utils.h"

#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "CrossRefErrors.hpp"
#include "DocxPackage.hpp"

namespace {

    inline const QString DOCX_EXTENSION = QStringLiteral("docx");

    QByteArray readAll(const QString &path) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw autocref::IoError("error reading the file " + path.toStdString() + ": " +
                                    file.errorString().toStdString());
        }
        QByteArray contents = file.readAll();
        if (file.error() != QFileDevice::NoError) {
            throw autocref::IoError("error reading the file " + path.toStdString() + ": " +
                                    file.errorString().toStdString());
        }
        return contents;
    }

    void writeAll(const QString &path, const char *data, const qint64 size) {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            throw autocref::IoError("error opening " + path.toStdString() + " for writing: " +
                                    file.errorString().toStdString());
        }
        if (file.write(data, size) != size || !file.commit()) {
            throw autocref::IoError("error writing the file " + path.toStdString() + ": " +
                                    file.errorString().toStdString());
        }
    }

} // anonymous namespace

std::string loadTextFile(const QString &path)
{
    const QByteArray contents = readAll(path);
    return std::string(contents.constData(), static_cast<size_t>(contents.size()));
}

void saveTextFile(const QString &path, const std::string_view text)
{
    writeAll(path, text.data(), static_cast<qint64>(text.size()));
}

std::vector<uint8_t> loadBinaryFile(const QString &path)
{
    const QByteArray contents = readAll(path);
    return std::vector<uint8_t>(contents.cbegin(), contents.cend());
}

void saveBinaryFile(const QString &path, const std::vector<uint8_t> &bytes)
{
    writeAll(path, reinterpret_cast<const char *>(bytes.data()), static_cast<qint64>(bytes.size()));
}

bool isDocxPath(const QString &path)
{
    return QFileInfo(path).suffix().compare(DOCX_EXTENSION, Qt::CaseInsensitive) == 0;
}

QString resolveOutputPath(const QString &inputPath, const QString &outputPath)
{
    return outputPath.isEmpty() ? inputPath : outputPath;
}

ConvertResult convertDocxFile(const QString &inputPath,
                              const QString &outputPath,
                              const autocref::ProcessOptions &options)
{
    try {
        // the whole package is in memory before the output is opened, so
        // overwriting the input in place is safe
        const std::vector<uint8_t> inputBytes = loadBinaryFile(inputPath);

        auto [success, message, outputBytes] = autocref::docx::ConvertBytes(inputBytes, options);
        if (!success)
            return {false, message};

        saveBinaryFile(resolveOutputPath(inputPath, outputPath), outputBytes);
        return {true, message};
    } catch (const autocref::IoError &e) {
        return {false, std::string("❌ ") + e.what()};
    }
}
