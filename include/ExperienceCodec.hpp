#ifndef EXPERIENCE_CODEC_HPP
#define EXPERIENCE_CODEC_HPP

#include "Common.hpp"
#include "StructuredData.hpp"
#include <string>

// Packs an experience into a flat byte record and zstd-compresses it.
// Tensors are stored on the CPU with their dtype and shape.
class ExperienceCodec {
public:
  explicit ExperienceCodec(int compressionLevel_ = COMPRESSION_LEVEL)
      : compressionLevel(compressionLevel_) {}

  StoredData compress(const Experience &experience) const;
  Experience decompress(const StoredData &compressed) const;

  std::string encode(const Experience &experience) const;
  Experience decode(const std::string &bytes) const;

private:
  int compressionLevel;
};

#endif // EXPERIENCE_CODEC_HPP
