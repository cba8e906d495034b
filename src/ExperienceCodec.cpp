#include "ExperienceCodec.hpp"
#include "Errors.hpp"
#include <cstring>
#include <zstd.h> // presumes zstd library is installed

namespace {

class ByteWriter {
public:
  explicit ByteWriter(std::string &out_) : out(out_) {}

  template <typename T> void put(const T &value) {
    out.append(reinterpret_cast<const char *>(&value), sizeof(T));
  }

  void putBytes(const void *ptr, size_t size) {
    out.append(static_cast<const char *>(ptr), size);
  }

  void putString(const std::string &value) {
    put<uint32_t>(static_cast<uint32_t>(value.size()));
    putBytes(value.data(), value.size());
  }

  void putTensor(const torch::Tensor &tensor) {
    put<uint8_t>(tensor.defined());
    if (!tensor.defined()) {
      return;
    }
    auto cpu = tensor.detach().to(torch::kCPU).contiguous();
    put<int8_t>(static_cast<int8_t>(cpu.scalar_type()));
    put<uint32_t>(static_cast<uint32_t>(cpu.dim()));
    for (auto size : cpu.sizes()) {
      put<int64_t>(size);
    }
    auto nbytes = static_cast<uint64_t>(cpu.numel() * cpu.element_size());
    put<uint64_t>(nbytes);
    putBytes(cpu.data_ptr(), nbytes);
  }

private:
  std::string &out;
};

class ByteReader {
public:
  explicit ByteReader(const std::string &in_) : in(in_) {}

  template <typename T> T get() {
    T value;
    getBytes(&value, sizeof(T));
    return value;
  }

  void getBytes(void *ptr, size_t size) {
    if (pos + size > in.size()) {
      throw CodecError("truncated experience record");
    }
    std::memcpy(ptr, in.data() + pos, size);
    pos += size;
  }

  std::string getString() {
    auto size = get<uint32_t>();
    std::string value(size, '\0');
    getBytes(value.data(), size);
    return value;
  }

  torch::Tensor getTensor() {
    if (!get<uint8_t>()) {
      return torch::Tensor();
    }
    auto scalarType = static_cast<torch::ScalarType>(get<int8_t>());
    auto dim = get<uint32_t>();
    std::vector<int64_t> sizes(dim);
    for (auto &size : sizes) {
      size = get<int64_t>();
    }
    auto nbytes = get<uint64_t>();
    auto tensor = torch::empty(sizes, torch::TensorOptions().dtype(scalarType));
    if (nbytes != static_cast<uint64_t>(tensor.numel() * tensor.element_size())) {
      throw CodecError("tensor byte count does not match its shape");
    }
    getBytes(tensor.data_ptr(), nbytes);
    return tensor;
  }

  bool done() const { return pos == in.size(); }

private:
  const std::string &in;
  size_t pos = 0;
};

enum TransitionFlags : uint8_t {
  TERMINAL = 1,
  HAS_NEXT_STATE = 2,
  HAS_NEXT_ACTION = 4,
};

} // namespace

std::string ExperienceCodec::encode(const Experience &experience) const {
  std::string bytes;
  ByteWriter writer(bytes);

  writer.put<uint32_t>(static_cast<uint32_t>(experience.size()));
  for (const auto &transition : experience.transitions) {
    uint8_t flags = 0;
    if (transition.isStateTerminal) {
      flags |= TERMINAL;
    }
    if (transition.nextState) {
      flags |= HAS_NEXT_STATE;
    }
    if (transition.nextAction) {
      flags |= HAS_NEXT_ACTION;
    }
    writer.put<uint8_t>(flags);
    writer.put<int64_t>(transition.action);
    writer.put<float>(transition.reward);
    writer.put<int64_t>(transition.nextAction.value_or(0));
    writer.putTensor(transition.state);
    if (transition.nextState) {
      writer.putTensor(*transition.nextState);
    }
    writer.put<uint32_t>(static_cast<uint32_t>(transition.extras.size()));
    for (const auto &[key, value] : transition.extras) {
      writer.putString(key);
      writer.put<double>(value);
    }
  }
  return bytes;
}

Experience ExperienceCodec::decode(const std::string &bytes) const {
  ByteReader reader(bytes);
  Experience experience;

  auto count = reader.get<uint32_t>();
  experience.transitions.resize(count);
  for (auto &transition : experience.transitions) {
    auto flags = reader.get<uint8_t>();
    transition.isStateTerminal = flags & TERMINAL;
    transition.action = reader.get<int64_t>();
    transition.reward = reader.get<float>();
    auto nextAction = reader.get<int64_t>();
    if (flags & HAS_NEXT_ACTION) {
      transition.nextAction = nextAction;
    }
    transition.state = reader.getTensor();
    if (flags & HAS_NEXT_STATE) {
      transition.nextState = reader.getTensor();
    }
    auto extraCount = reader.get<uint32_t>();
    for (uint32_t i = 0; i < extraCount; i++) {
      auto key = reader.getString();
      transition.extras[key] = reader.get<double>();
    }
  }

  if (!reader.done()) {
    throw CodecError("trailing bytes after experience record");
  }
  return experience;
}

StoredData ExperienceCodec::compress(const Experience &experience) const {
  auto bytes = encode(experience);

  size_t const maxCompressedSize = ZSTD_compressBound(bytes.size());
  auto tmp = std::make_unique<char[]>(maxCompressedSize);
  size_t const compressedSize =
      ZSTD_compress(tmp.get(), maxCompressedSize, bytes.data(), bytes.size(),
                    compressionLevel);
  if (ZSTD_isError(compressedSize)) {
    throw CodecError(std::string("zstd compression failed: ") +
                     ZSTD_getErrorName(compressedSize));
  }

  StoredData data;
  data.size = compressedSize;
  data.ptr = std::make_unique<char[]>(compressedSize);
  std::memcpy(data.ptr.get(), tmp.get(), compressedSize);
  return data;
}

Experience ExperienceCodec::decompress(const StoredData &compressed) const {
  if (!compressed.ptr) {
    throw CodecError("empty experience slot");
  }

  auto const contentSize =
      ZSTD_getFrameContentSize(compressed.ptr.get(), compressed.size);
  if (contentSize == ZSTD_CONTENTSIZE_ERROR ||
      contentSize == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CodecError("not a zstd frame with a known content size");
  }

  std::string bytes(contentSize, '\0');
  size_t const decompressedSize = ZSTD_decompress(
      bytes.data(), bytes.size(), compressed.ptr.get(), compressed.size);
  if (ZSTD_isError(decompressedSize)) {
    throw CodecError(std::string("zstd decompression failed: ") +
                     ZSTD_getErrorName(decompressedSize));
  }
  bytes.resize(decompressedSize);
  return decode(bytes);
}
