#include "lib/gzip_stream.hpp"
#include "lib/errors.hpp"
#include <zlib.h>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <memory>

namespace GzipStream {
    
    static const size_t CHUNK = 128 * 1024;
    
    // windowBits 15 plus 16 selects the gzip wrapper instead of raw zlib
    static const int GZIP_WINDOW_BITS = 15 | 16;
    
    struct FileCloser {
        void operator()(FILE* file) const {
            if (file != nullptr) fclose(file);
        }
    };
    using FilePtr = std::unique_ptr<FILE, FileCloser>;
    
    static FilePtr openFile(const std::string& path, const char* mode) {
        FilePtr file(fopen(path.c_str(), mode));
        if (!file) {
            throw FilesystemError("Cannot open " + path + ": " + strerror(errno));
        }
        return file;
    }
    
    static void writeAll(FILE* out, const unsigned char* data, size_t len, const std::string& path) {
        if (len > 0 && fwrite(data, 1, len, out) != len) {
            throw FilesystemError("Failed writing " + path + ": " + strerror(errno));
        }
    }
    
    static void finishFile(FilePtr& file, const std::string& path) {
        if (fclose(file.release()) != 0) {
            throw FilesystemError("Failed closing " + path + ": " + strerror(errno));
        }
    }
    
    bool hasGzipMagic(const std::string& path) {
        FilePtr file(fopen(path.c_str(), "rb"));
        if (!file) {
            return false;
        }
        
        unsigned char magic[2] = {0, 0};
        if (fread(magic, 1, sizeof(magic), file.get()) != sizeof(magic)) {
            return false;
        }
        return magic[0] == 0x1f && magic[1] == 0x8b;
    }
    
    void decompressFile(const std::string& input, const std::string& output) {
        FilePtr in = openFile(input, "rb");
        FilePtr out = openFile(output, "wb");
        
        z_stream strm;
        memset(&strm, 0, sizeof(strm));
        if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK) {
            throw InvalidFormatError(input, "Cannot initialize gzip decoder");
        }
        std::unique_ptr<z_stream, int (*)(z_streamp)> streamGuard(&strm, inflateEnd);
        
        std::unique_ptr<unsigned char[]> inbuf(new unsigned char[CHUNK]);
        std::unique_ptr<unsigned char[]> outbuf(new unsigned char[CHUNK]);
        
        int code = Z_OK;
        bool sawData = false;
        
        while (true) {
            if (strm.avail_in == 0) {
                size_t n = fread(inbuf.get(), 1, CHUNK, in.get());
                if (ferror(in.get())) {
                    throw FilesystemError("Failed reading " + input + ": " + strerror(errno));
                }
                if (n == 0) break;
                strm.next_in = inbuf.get();
                strm.avail_in = static_cast<uInt>(n);
                sawData = true;
            }
            
            do {
                strm.next_out = outbuf.get();
                strm.avail_out = static_cast<uInt>(CHUNK);
                code = inflate(&strm, Z_NO_FLUSH);
                if (code == Z_NEED_DICT || code == Z_DATA_ERROR || 
                    code == Z_MEM_ERROR || code == Z_STREAM_ERROR) {
                    throw InvalidFormatError(input, "Corrupt gzip stream (zlib error " + 
                                             std::to_string(code) + ")");
                }
                writeAll(out.get(), outbuf.get(), CHUNK - strm.avail_out, output);
            } while (strm.avail_out == 0 && code != Z_STREAM_END);
            
            if (code == Z_STREAM_END) {
                // A member can end anywhere in the buffer; keep at least the
                // two magic bytes of a following member in view
                if (strm.avail_in < 2) {
                    size_t kept = strm.avail_in;
                    if (kept > 0) {
                        memmove(inbuf.get(), strm.next_in, kept);
                    }
                    size_t n = fread(inbuf.get() + kept, 1, CHUNK - kept, in.get());
                    if (ferror(in.get())) {
                        throw FilesystemError("Failed reading " + input + ": " + strerror(errno));
                    }
                    strm.next_in = inbuf.get();
                    strm.avail_in = static_cast<uInt>(kept + n);
                }
                
                // Concatenated members are legal gzip; anything else after
                // a member is trailing padding and ends the data
                if (strm.avail_in >= 2 && strm.next_in[0] == 0x1f && strm.next_in[1] == 0x8b) {
                    inflateReset(&strm);
                    code = Z_OK;
                    continue;
                }
                break;
            }
        }
        
        if (!sawData || code != Z_STREAM_END) {
            throw InvalidFormatError(input, "Truncated gzip stream");
        }
        
        finishFile(out, output);
    }
    
    void compressFile(const std::string& input, const std::string& output, int level) {
        FilePtr in = openFile(input, "rb");
        FilePtr out = openFile(output, "wb");
        
        z_stream strm;
        memset(&strm, 0, sizeof(strm));
        if (deflateInit2(&strm, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw FilesystemError("Cannot initialize gzip encoder for " + output);
        }
        std::unique_ptr<z_stream, int (*)(z_streamp)> streamGuard(&strm, deflateEnd);
        
        std::unique_ptr<unsigned char[]> inbuf(new unsigned char[CHUNK]);
        std::unique_ptr<unsigned char[]> outbuf(new unsigned char[CHUNK]);
        
        int flush = Z_NO_FLUSH;
        do {
            size_t n = fread(inbuf.get(), 1, CHUNK, in.get());
            if (ferror(in.get())) {
                throw FilesystemError("Failed reading " + input + ": " + strerror(errno));
            }
            flush = feof(in.get()) ? Z_FINISH : Z_NO_FLUSH;
            strm.next_in = inbuf.get();
            strm.avail_in = static_cast<uInt>(n);
            
            do {
                strm.next_out = outbuf.get();
                strm.avail_out = static_cast<uInt>(CHUNK);
                if (deflate(&strm, flush) == Z_STREAM_ERROR) {
                    throw FilesystemError("gzip encoding failed for " + output);
                }
                writeAll(out.get(), outbuf.get(), CHUNK - strm.avail_out, output);
            } while (strm.avail_out == 0);
        } while (flush != Z_FINISH);
        
        finishFile(out, output);
    }
}
