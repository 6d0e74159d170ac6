#ifndef DRTP_CHUNK_STREAM_H
#define DRTP_CHUNK_STREAM_H

#include <stdint.h>
#include <stddef.h>
#include <fstream>
#include <string>

#include "common/packet.hpp"

/**
 * @brief Number of chunks needed for size bytes, ceil(size / chunkSize).
 */
uint64_t totalChunks(uint64_t size, size_t chunkSize = DRTP_CHUNK_SIZE);

/**
 * @brief Length of the 1-based chunk index of a source of size bytes.
 * Every chunk is full except the last one. Out of range indexes have length 0.
 */
size_t chunkLength(uint64_t size, uint64_t index, size_t chunkSize = DRTP_CHUNK_SIZE);

// Where the sender takes its payloads from
class ChunkSource
{
public:
    virtual ~ChunkSource() {}

    // throws DrtpError(SOURCE_UNAVAILABLE) if the bytes can't be reached
    virtual void open() = 0;
    virtual uint64_t size() const = 0;

    /**
     * @brief Copy the 1-based chunk index into out, which must hold chunkSize bytes.
     * @return the number of bytes copied.
     */
    virtual size_t readChunk(uint64_t index, uint8_t *out) = 0;
    virtual void close() = 0;

    size_t chunkSize() const { return chunkBytes; }

protected:
    explicit ChunkSource(size_t chunkSize) : chunkBytes(chunkSize) {}

private:
    size_t chunkBytes;
};

// Where the receiver puts in-order payloads
class ChunkSink
{
public:
    virtual ~ChunkSink() {}

    // Opens the destination, truncating it. throws DrtpError(SINK_UNAVAILABLE)
    virtual void open() = 0;
    virtual void write(const uint8_t *data, size_t len) = 0;
    virtual void close() = 0;
};

class FileChunkSource : public ChunkSource
{
public:
    explicit FileChunkSource(const std::string &path, size_t chunkSize = DRTP_CHUNK_SIZE);

    void open();
    uint64_t size() const { return fileSize; }
    size_t readChunk(uint64_t index, uint8_t *out);
    void close();

private:
    std::string path;
    std::ifstream file;
    uint64_t fileSize;
};

class FileChunkSink : public ChunkSink
{
public:
    explicit FileChunkSink(const std::string &path);

    void open();
    void write(const uint8_t *data, size_t len);
    void close();

private:
    std::string path;
    std::ofstream out;
};

// Byte buffer backed source, a source that "doesn't exist" fails on open
class MemoryChunkSource : public ChunkSource
{
public:
    explicit MemoryChunkSource(const Datagram &bytes, size_t chunkSize = DRTP_CHUNK_SIZE);
    MemoryChunkSource();

    void open();
    uint64_t size() const { return bytes.size(); }
    size_t readChunk(uint64_t index, uint8_t *out);
    void close() { opened = false; }

    // number of readChunk calls so far
    size_t reads() const { return readCount; }

private:
    Datagram bytes;
    bool available;
    bool opened;
    size_t readCount;
};

class MemoryChunkSink : public ChunkSink
{
public:
    MemoryChunkSink() : opened(false), writeCount(0) {}

    void open();
    void write(const uint8_t *data, size_t len);
    void close() { opened = false; }

    const Datagram &contents() const { return bytes; }
    size_t writes() const { return writeCount; }
    bool isOpen() const { return opened; }

private:
    Datagram bytes;
    bool opened;
    size_t writeCount;
};

#endif
