#include <gtest/gtest.h>

#include "dump_folder_lock.hpp"
#include "test_helpers.hpp"

// ------------- Tests -----------------

TEST(DumpFolderLock, SecondHolderIsRejectedUntilRelease)
{
  TempDir td;
  auto path = td.dir / ".branchvault.lock";
  {
    auto first = DumpFolderLock::acquire(path);
    ASSERT_TRUE(first) << first.error();
    auto second = DumpFolderLock::acquire(path);
    ASSERT_FALSE(second);
    EXPECT_NE(second.error().find("in progress"), std::string::npos);
  }
  auto again = DumpFolderLock::acquire(path);
  EXPECT_TRUE(again);
}

TEST(DumpFolderLock, MovedLockStaysHeld)
{
  TempDir td;
  auto path = td.dir / ".branchvault.lock";
  auto first = DumpFolderLock::acquire(path);
  ASSERT_TRUE(first);
  DumpFolderLock moved = std::move(*first);
  EXPECT_FALSE(DumpFolderLock::acquire(path));
}

TEST(DumpFolderLock, MissingDirectoryIsAnError)
{
  TempDir td;
  auto lock = DumpFolderLock::acquire(td.dir / "absent" / ".lock");
  ASSERT_FALSE(lock);
  EXPECT_NE(lock.error().find("Failed to open lock file"), std::string::npos);
}
