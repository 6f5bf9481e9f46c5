#include <string>
#include <vector>

#include "mtz/error.hpp"
#include "mtz/file_record.hpp"
#include "mtz/fs.hpp"
#include "util/byte_util.hpp"

#include "gtest/gtest.h"

namespace {

mtz::FileRecord sample_record(mtz::ExtraFields extra_fields = {},
                              std::optional<std::string> comment = {}) {
  return mtz::FileRecord("dir/a.txt", mtz::CompressionType::stored, 0xDEADBEEF,
                         3, {1, 2, 3}, 0100600, std::move(extra_fields),
                         std::move(comment));
}

}  // namespace

TEST(file_record, directory_name_gets_separator) {
  const auto plain = mtz::FileRecord::directory("docs", 040755, {}, {});
  EXPECT_EQ(plain.get_filename(), "docs/");

  const auto slashed = mtz::FileRecord::directory("docs/", 040755, {}, {});
  EXPECT_EQ(slashed.get_filename(), "docs/");

  const auto backslashed =
      mtz::FileRecord::directory("a/b\\", 040755, {}, {});
  EXPECT_EQ(backslashed.get_filename(), "a/b/");
}

TEST(file_record, directory_is_empty_and_stored) {
  const auto dir =
      mtz::FileRecord::directory("docs", mtz::io::default_dir_attrs, {}, {});
  EXPECT_EQ(dir.get_method(), mtz::CompressionType::stored);
  EXPECT_EQ(dir.get_crc32(), 0u);
  EXPECT_EQ(dir.get_uncompressed_size(), 0u);
  EXPECT_EQ(dir.get_compressed_size(), 0u);
  EXPECT_TRUE(dir.get_data().empty());
  EXPECT_EQ(dir.get_external_attr(),
            static_cast<mtz::ExternalAttr>(mtz::io::default_dir_attrs) << 16);
}

TEST(file_record, local_header_layout) {
  const auto record = sample_record();
  std::vector<mtz::Byte> buffer;
  record.write_local_file_header(buffer);
  ASSERT_EQ(buffer.size(), 30u + 9u);

  const mtz::Byte* p = buffer.data();
  EXPECT_EQ(mtz::unmarshal_32(p), 0x04034B50u);
  EXPECT_EQ(mtz::unmarshal_16(p + 4), 20);
  EXPECT_EQ(mtz::unmarshal_16(p + 6), 0x0800);
  EXPECT_EQ(mtz::unmarshal_16(p + 8), 0);
  EXPECT_EQ(mtz::unmarshal_16(p + 10), 0);
  EXPECT_EQ(mtz::unmarshal_16(p + 12), 0);
  EXPECT_EQ(mtz::unmarshal_32(p + 14), 0xDEADBEEFu);
  EXPECT_EQ(mtz::unmarshal_32(p + 18), 3u);
  EXPECT_EQ(mtz::unmarshal_32(p + 22), 3u);
  EXPECT_EQ(mtz::unmarshal_16(p + 26), 9);
  EXPECT_EQ(mtz::unmarshal_16(p + 28), 0);
  EXPECT_EQ(std::string(buffer.begin() + 30, buffer.end()), "dir/a.txt");
}

TEST(file_record, central_header_layout) {
  const auto record =
      sample_record({mtz::UnixExtendedTimestamp{1, 2, 3}}, std::string("hi"));
  std::vector<mtz::Byte> local;
  record.write_local_file_header(local);
  EXPECT_EQ(mtz::unmarshal_16(local.data() + 28), 17);
  EXPECT_EQ(local.size(), 30u + 9u + 17u);

  std::vector<mtz::Byte> buffer;
  record.write_central_directory_file_header(buffer, 0x01020304);
  ASSERT_EQ(buffer.size(), 46u + 9u + 9u + 2u);

  const mtz::Byte* p = buffer.data();
  EXPECT_EQ(mtz::unmarshal_32(p), 0x02014B50u);
  EXPECT_EQ(mtz::unmarshal_16(p + 4) & 0xFF, 62);
  EXPECT_EQ(mtz::unmarshal_16(p + 6), 20);
  EXPECT_EQ(mtz::unmarshal_16(p + 8), 0x0800);
  EXPECT_EQ(mtz::unmarshal_32(p + 16), 0xDEADBEEFu);
  EXPECT_EQ(mtz::unmarshal_16(p + 28), 9);
  EXPECT_EQ(mtz::unmarshal_16(p + 30), 9);
  EXPECT_EQ(mtz::unmarshal_16(p + 32), 2);
  EXPECT_EQ(mtz::unmarshal_16(p + 34), 0);
  EXPECT_EQ(mtz::unmarshal_16(p + 36), 0);
  EXPECT_EQ(mtz::unmarshal_32(p + 38), 0100600u << 16);
  EXPECT_EQ(mtz::unmarshal_32(p + 42), 0x01020304u);
  EXPECT_EQ(std::string(buffer.begin() + 46, buffer.begin() + 55), "dir/a.txt");
  EXPECT_EQ(mtz::unmarshal_16(p + 55), 0x5455);
  EXPECT_EQ(std::string(buffer.end() - 2, buffer.end()), "hi");
}

TEST(file_record, oversized_name_rejected) {
  const mtz::FileRecord record(std::string(70000, 'x'),
                               mtz::CompressionType::stored, 0, 0, {}, 0, {},
                               {});
  std::vector<mtz::Byte> buffer;
  EXPECT_THROW(record.write_local_file_header(buffer), mtz::CapacityError);
  EXPECT_THROW(record.write_central_directory_file_header(buffer, 0),
               mtz::CapacityError);
}

TEST(file_record, release_keeps_sizes) {
  auto record = sample_record();
  record.release_data();
  EXPECT_TRUE(record.get_data().empty());
  EXPECT_EQ(record.get_compressed_size(), 3u);
  EXPECT_EQ(record.get_uncompressed_size(), 3u);
}
