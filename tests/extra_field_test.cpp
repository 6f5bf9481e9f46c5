#include <vector>

#include "mtz/error.hpp"
#include "mtz/extra_field.hpp"

#include "gtest/gtest.h"

namespace {

std::vector<mtz::Byte> marshal(const mtz::ExtraFields& fields,
                               mtz::HeaderPlacement placement) {
  std::vector<mtz::Byte> out(fields.data_length(placement));
  mtz::Byte* p = out.data();
  fields.marshal(p, placement);
  EXPECT_EQ(p, out.data() + out.size());
  return out;
}

}  // namespace

TEST(extra_field, ntfs_layout) {
  const mtz::ExtraFields fields{
      mtz::NtfsTimestamps{0x0102030405060708ull, 2, 3}};
  EXPECT_EQ(fields.data_length(mtz::HeaderPlacement::local), 36);
  EXPECT_EQ(fields.data_length(mtz::HeaderPlacement::central), 36);

  const auto bytes = marshal(fields, mtz::HeaderPlacement::local);
  const std::vector<mtz::Byte> head = {0x0A, 0x00, 32, 0,  0, 0,
                                       0,    0,    1,  0,  24, 0};
  EXPECT_EQ(std::vector<mtz::Byte>(bytes.begin(), bytes.begin() + 12), head);
  const std::vector<mtz::Byte> mtime = {8, 7, 6, 5, 4, 3, 2, 1};
  EXPECT_EQ(std::vector<mtz::Byte>(bytes.begin() + 12, bytes.begin() + 20),
            mtime);
  EXPECT_EQ(bytes[20], 2);
  EXPECT_EQ(bytes[28], 3);
  EXPECT_EQ(bytes, marshal(fields, mtz::HeaderPlacement::central));
}

TEST(extra_field, extended_timestamp_shrinks_in_central) {
  const mtz::ExtraField field =
      mtz::UnixExtendedTimestamp{0x11223344, 0x55667788, 0x01020304};
  EXPECT_EQ(mtz::extra_field_header_id(field), 0x5455);
  EXPECT_EQ(mtz::extra_field_size(field, mtz::HeaderPlacement::local), 13);
  EXPECT_EQ(mtz::extra_field_size(field, mtz::HeaderPlacement::central), 5);

  const mtz::ExtraFields fields{field};
  const auto local = marshal(fields, mtz::HeaderPlacement::local);
  const std::vector<mtz::Byte> expected_local = {
      0x55, 0x54, 13,   0,    0x07, 0x44, 0x33, 0x22, 0x11,
      0x88, 0x77, 0x66, 0x55, 0x04, 0x03, 0x02, 0x01};
  EXPECT_EQ(local, expected_local);

  const auto central = marshal(fields, mtz::HeaderPlacement::central);
  const std::vector<mtz::Byte> expected_central = {0x55, 0x54, 5,    0,   0x07,
                                                   0x44, 0x33, 0x22, 0x11};
  EXPECT_EQ(central, expected_central);
}

TEST(extra_field, extended_timestamp_partial) {
  const mtz::ExtraField mod_only =
      mtz::UnixExtendedTimestamp{7, std::nullopt, std::nullopt};
  EXPECT_EQ(mtz::extra_field_size(mod_only, mtz::HeaderPlacement::local), 5);
  EXPECT_EQ(mtz::extra_field_size(mod_only, mtz::HeaderPlacement::central), 5);

  const mtz::ExtraField access_only =
      mtz::UnixExtendedTimestamp{std::nullopt, 7, std::nullopt};
  EXPECT_EQ(mtz::extra_field_size(access_only, mtz::HeaderPlacement::local), 5);
  EXPECT_EQ(mtz::extra_field_size(access_only, mtz::HeaderPlacement::central),
            1);
  const auto central = marshal(mtz::ExtraFields{access_only},
                               mtz::HeaderPlacement::central);
  ASSERT_EQ(central.size(), 5u);
  EXPECT_EQ(central[4], 0x02);
}

TEST(extra_field, ownership_layout) {
  const mtz::ExtraFields fields{mtz::UnixOwnership{1000, 0x01020304}};
  const auto bytes = marshal(fields, mtz::HeaderPlacement::central);
  const std::vector<mtz::Byte> expected = {0x75, 0x78, 11, 0, 1, 4,    0xE8, 0x03,
                                           0,    0,    4,  4, 3, 2, 1};
  EXPECT_EQ(bytes, expected);
}

TEST(extra_field, collection_lengths) {
  mtz::ExtraFields fields;
  EXPECT_TRUE(fields.empty());
  EXPECT_EQ(fields.data_length(mtz::HeaderPlacement::local), 0);

  fields.add(mtz::UnixExtendedTimestamp{1, 2, 3});
  fields.add(mtz::UnixOwnership{0, 0});
  EXPECT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields.data_length(mtz::HeaderPlacement::local), 17 + 15);
  EXPECT_EQ(fields.data_length(mtz::HeaderPlacement::central), 9 + 15);

  // Insertion order is kept.
  const auto bytes = marshal(fields, mtz::HeaderPlacement::local);
  EXPECT_EQ(bytes[0], 0x55);
  EXPECT_EQ(bytes[17], 0x75);
}

TEST(extra_field, length_overflow) {
  mtz::ExtraFields fields;
  for (int i = 0; i < 2000; ++i) {
    fields.add(mtz::NtfsTimestamps{0, 0, 0});
  }
  EXPECT_THROW((void)fields.data_length(mtz::HeaderPlacement::local),
               mtz::CapacityError);
}

#ifndef WIN32
TEST(extra_field, from_stat) {
  struct stat st {};
  st.st_mtime = 100;
  st.st_atime = 200;
  st.st_ctime = 300;
  st.st_uid = 1000;
  st.st_gid = 100;
  const auto fields = mtz::ExtraFields::from_stat(st);
  ASSERT_EQ(fields.size(), 2u);

  const auto* ts =
      std::get_if<mtz::UnixExtendedTimestamp>(&fields.values()[0]);
  ASSERT_NE(ts, nullptr);
  EXPECT_EQ(ts->mod_time.value(), 100);
  EXPECT_EQ(ts->ac_time.value(), 200);
  EXPECT_EQ(ts->cr_time.value(), 300);

  const auto* owner = std::get_if<mtz::UnixOwnership>(&fields.values()[1]);
  ASSERT_NE(owner, nullptr);
  EXPECT_EQ(owner->uid, 1000u);
  EXPECT_EQ(owner->gid, 100u);
}
#endif
