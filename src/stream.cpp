#include <algorithm>
#include <vector>

#include <fmt/format.h>

#include <packer/stream.hpp>
#include <packer/varint.hpp>

namespace packer {

std::optional<size_t> StreamReader::readSome(std::span<uint8_t> buffer, Error *outError) {
  size_t total = 0;
  while (total < buffer.size()) {
    in_.read(reinterpret_cast<char *>(buffer.data() + total),
             static_cast<std::streamsize>(buffer.size() - total));
    auto count = in_.gcount();
    total += static_cast<size_t>(count);
    offset_ += static_cast<uint64_t>(count);
    if (in_.bad()) {
      fail(outError, ErrorKind::IO, "", "Failed to read archive stream", offset_);
      return std::nullopt;
    }
    if (in_.eof() || count == 0) {
      break;
    }
  }
  return total;
}

bool StreamReader::readExact(std::span<uint8_t> buffer, std::string_view what,
                             const std::string &path, Error *outError) {
  uint64_t start = offset_;
  auto count = readSome(buffer, outError);
  if (!count) {
    return false;
  }
  if (*count != buffer.size()) {
    return fail(outError, ErrorKind::Format, path,
                fmt::format("Truncated {} (expected {} bytes, got {})", what, buffer.size(),
                            *count),
                start);
  }
  return true;
}

bool StreamReader::readByte(uint8_t &out, std::string_view what, const std::string &path,
                            Error *outError) {
  return readExact(std::span<uint8_t>(&out, 1), what, path, outError);
}

std::optional<uint64_t> StreamReader::readVarint(std::string_view what, const std::string &path,
                                                 Error *outError) {
  uint64_t start = offset_;
  VarintDecoder decoder;
  while (true) {
    uint8_t byte = 0;
    auto count = readSome(std::span<uint8_t>(&byte, 1), outError);
    if (!count) {
      return std::nullopt;
    }
    if (*count == 0) {
      fail(outError, ErrorKind::Format, path, fmt::format("Truncated {}", what), start);
      return std::nullopt;
    }
    switch (decoder.feed(byte)) {
    case VarintDecoder::State::NeedMore:
      break;
    case VarintDecoder::State::Done:
      return decoder.value();
    case VarintDecoder::State::Overflow:
      fail(outError, ErrorKind::Format, path, fmt::format("Varint overflow in {}", what), start);
      return std::nullopt;
    }
  }
}

bool StreamReader::skip(uint64_t count, std::string_view what, const std::string &path,
                        Error *outError) {
  std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(count, copyBufferSize)));
  while (count > 0) {
    size_t chunk = static_cast<size_t>(std::min<uint64_t>(count, buffer.size()));
    if (!readExact(std::span<uint8_t>(buffer.data(), chunk), what, path, outError)) {
      return false;
    }
    count -= chunk;
  }
  return true;
}

bool StreamReader::copyToSink(uint64_t size, EntrySink &sink, const std::string &path,
                              Error *outError) {
  std::vector<uint8_t> buffer(static_cast<size_t>(std::min<uint64_t>(size, copyBufferSize)));
  while (size > 0) {
    size_t chunk = static_cast<size_t>(std::min<uint64_t>(size, buffer.size()));
    std::span<uint8_t> view(buffer.data(), chunk);
    if (!readExact(view, "payload", path, outError)) {
      return false;
    }
    if (!sink.writePayload(view, outError)) {
      return false;
    }
    size -= chunk;
  }
  return true;
}

bool writeBytes(std::ostream &out, std::span<const uint8_t> data, const std::string &path,
                Error *outError) {
  out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!out) {
    return fail(outError, ErrorKind::IO, path, "Failed to write archive stream");
  }
  return true;
}

} // namespace packer
