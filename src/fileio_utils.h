#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "CrossRefPipeline.hpp"

// Plain file helpers. Loads throw autocref::IoError; saves go through
// QSaveFile, so the target is either fully replaced or left untouched.

std::string loadTextFile(const QString &path);
void saveTextFile(const QString &path, std::string_view text);

std::vector<uint8_t> loadBinaryFile(const QString &path);
void saveBinaryFile(const QString &path, const std::vector<uint8_t> &bytes);

bool isDocxPath(const QString &path);

// Blank output means "overwrite the input".
QString resolveOutputPath(const QString &inputPath, const QString &outputPath);

struct ConvertResult {
    bool success;
    std::string message;
};

// File IO wrapper: read .docx -> docx::ConvertBytes (core) -> write .docx.
// Input and output may be the same path.
ConvertResult convertDocxFile(const QString &inputPath,
                              const QString &outputPath,
                              const autocref::ProcessOptions &options = {});
