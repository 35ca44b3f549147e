#ifndef GZIP_STREAM_HPP
#define GZIP_STREAM_HPP

#include <string>

namespace GzipStream {
    // True when the file starts with the gzip magic bytes 1f 8b.
    bool hasGzipMagic(const std::string& path);
    
    // Inflates every gzip member of input into output (created or truncated).
    void decompressFile(const std::string& input, const std::string& output);
    
    // Deflates input into a single gzip member at output, level 9.
    void compressFile(const std::string& input, const std::string& output, int level = 9);
}

#endif // GZIP_STREAM_HPP
