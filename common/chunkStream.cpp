#include <string.h>

#include "common/chunkStream.hpp"
#include "common/drtpError.hpp"

uint64_t totalChunks(uint64_t size, size_t chunkSize)
{
    return (size + chunkSize - 1) / chunkSize;
}

size_t chunkLength(uint64_t size, uint64_t index, size_t chunkSize)
{
    uint64_t chunks = totalChunks(size, chunkSize);
    if (index == 0 || index > chunks)
        return 0;
    if (index < chunks)
        return chunkSize;
    return size - chunkSize * (chunks - 1);
}

FileChunkSource::FileChunkSource(const std::string &path, size_t chunkSize)
    : ChunkSource(chunkSize), path(path), fileSize(0)
{
}

void FileChunkSource::open()
{
    // read the file as a stream of binary data.
    this->file.open(this->path, std::ifstream::binary);

    // check the existence of the file.
    if (this->file.fail())
    {
        throw DrtpError(ErrorKind::SOURCE_UNAVAILABLE, "File '" + this->path + "' not found.");
    }

    this->file.seekg(0, std::ios::end);
    std::streamoff end = this->file.tellg();
    if (end < 0)
    {
        this->file.close();
        throw DrtpError(ErrorKind::SOURCE_UNAVAILABLE, "Can't get the size of '" + this->path + "'");
    }
    this->fileSize = end;
    this->file.seekg(0, std::ios::beg);
}

size_t FileChunkSource::readChunk(uint64_t index, uint8_t *out)
{
    size_t expected = chunkLength(this->fileSize, index, this->chunkSize());
    if (expected == 0)
        return 0;

    // chunks are re-read on every retransmission, so always seek to the chunk
    this->file.clear();
    this->file.seekg((index - 1) * this->chunkSize(), std::ios::beg);
    this->file.read(reinterpret_cast<char *>(out), expected);

    size_t count = this->file.gcount();
    if (count != expected)
    {
        throw DrtpError(ErrorKind::SOURCE_UNAVAILABLE,
                        "Short read of chunk " + std::to_string(index) + " from '" + this->path + "'");
    }
    return count;
}

void FileChunkSource::close()
{
    if (this->file.is_open())
        this->file.close();
}

FileChunkSink::FileChunkSink(const std::string &path) : path(path)
{
}

void FileChunkSink::open()
{
    if (this->out.is_open())
        this->out.close();

    this->out.open(this->path, std::ofstream::binary | std::ofstream::trunc);
    if (this->out.fail())
    {
        throw DrtpError(ErrorKind::SINK_UNAVAILABLE, "Can't open '" + this->path + "' for writing");
    }
}

void FileChunkSink::write(const uint8_t *data, size_t len)
{
    this->out.write(reinterpret_cast<const char *>(data), len);
    if (this->out.fail())
    {
        throw DrtpError(ErrorKind::SINK_UNAVAILABLE, "Write to '" + this->path + "' failed");
    }
}

void FileChunkSink::close()
{
    if (this->out.is_open())
        this->out.close();
}

MemoryChunkSource::MemoryChunkSource(const Datagram &bytes, size_t chunkSize)
    : ChunkSource(chunkSize), bytes(bytes), available(true), opened(false), readCount(0)
{
}

MemoryChunkSource::MemoryChunkSource()
    : ChunkSource(DRTP_CHUNK_SIZE), available(false), opened(false), readCount(0)
{
}

void MemoryChunkSource::open()
{
    if (!this->available)
    {
        throw DrtpError(ErrorKind::SOURCE_UNAVAILABLE, "in-memory source is not available");
    }
    this->opened = true;
}

size_t MemoryChunkSource::readChunk(uint64_t index, uint8_t *out)
{
    if (!this->opened)
    {
        throw DrtpError(ErrorKind::SOURCE_UNAVAILABLE, "in-memory source read before open");
    }
    size_t len = chunkLength(this->bytes.size(), index, this->chunkSize());
    if (len > 0)
    {
        memcpy(out, this->bytes.data() + (index - 1) * this->chunkSize(), len);
    }
    this->readCount++;
    return len;
}

void MemoryChunkSink::open()
{
    this->bytes.clear();
    this->opened = true;
}

void MemoryChunkSink::write(const uint8_t *data, size_t len)
{
    if (!this->opened)
    {
        throw DrtpError(ErrorKind::SINK_UNAVAILABLE, "in-memory sink written before open");
    }
    this->bytes.insert(this->bytes.end(), data, data + len);
    this->writeCount++;
}
