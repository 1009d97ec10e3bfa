#include <gtest/gtest.h>

#include "recall_core/db/sqlite_error_utils.hpp"

namespace recall_core {

TEST(SqliteErrorUtilsTest, ExtendedCodesClassifyByPrimaryCode) {
  EXPECT_EQ(classify_sqlite_code(SQLITE_BUSY_SNAPSHOT), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(classify_sqlite_code(SQLITE_IOERR_READ), DbErrorKind::Io);
  EXPECT_EQ(classify_sqlite_code(SQLITE_CONSTRAINT_PRIMARYKEY), DbErrorKind::Constraint);
  EXPECT_EQ(classify_sqlite_code(SQLITE_NOTADB), DbErrorKind::NotADatabase);
}

TEST(SqliteErrorUtilsTest, ContentionAndIoAreTransient) {
  EXPECT_TRUE(is_transient(classify_sqlite_code(SQLITE_BUSY)));
  EXPECT_TRUE(is_transient(classify_sqlite_code(SQLITE_LOCKED)));
  EXPECT_TRUE(is_transient(classify_sqlite_code(SQLITE_IOERR)));
  EXPECT_TRUE(is_transient(classify_sqlite_code(SQLITE_FULL)));
}

TEST(SqliteErrorUtilsTest, DataProblemsAreNotTransient) {
  EXPECT_FALSE(is_transient(classify_sqlite_code(SQLITE_CONSTRAINT)));
  EXPECT_FALSE(is_transient(classify_sqlite_code(SQLITE_CORRUPT)));
  EXPECT_FALSE(is_transient(classify_sqlite_code(SQLITE_NOTADB)));
  EXPECT_FALSE(is_transient(classify_sqlite_code(SQLITE_MISMATCH)));
}

TEST(SqliteErrorUtilsTest, KindNamesAreStable) {
  EXPECT_STREQ(kind_to_string(DbErrorKind::BusyOrLocked), "busy_or_locked");
  EXPECT_STREQ(kind_to_string(DbErrorKind::NotADatabase), "notadb");
  EXPECT_STREQ(kind_to_string(DbErrorKind::Generic), "generic");
}

}  // namespace recall_core
