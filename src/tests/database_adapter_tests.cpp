#include <gtest/gtest.h>
#include <algorithm>

#include "database_adapter.hpp"
#include "test_helpers.hpp"

namespace {

DatabaseConfig PostgresConfig()
{
  DatabaseConfig config;
  config.adapter = "postgres";
  config.database = "app_development";
  return config;
}

DatabaseConfig MySQLConfig()
{
  DatabaseConfig config;
  config.adapter = "mysql";
  config.database = "shop";
  config.user = "root";
  config.password = "secret";
  return config;
}

bool Contains(const std::vector<std::string> &argv, const std::string &arg)
{
  return std::ranges::find(argv, arg) != argv.end();
}

// Stores the "database" as bytes in memory and shells out to nothing.
class DummyAdapter : public DatabaseAdapter
{
public:
  DummyAdapter(const DatabaseConfig &config, const fs::path &dumpFolder, CommandRunner &runner)
      : DatabaseAdapter(config, dumpFolder, runner) {}

  bool dump(const std::string &branch) override
  {
    WriteAll(dumpPath(branch), content);
    return true;
  }

  bool restore(const std::string &branch) override
  {
    if (!dumpExists(branch))
      return false;
    content = ReadAll(dumpPath(branch));
    return true;
  }

  bool terminateConnections(const std::string &) override { return true; }

  std::string content;

protected:
  std::vector<std::string> connectionFlags() const override { return {}; }
};

} // namespace

// ------------- Tests -----------------

TEST(DatabaseAdapter, Build_SelectsVariantByEngine)
{
  TempDir td;
  FakeRunner runner;
  auto pg = PostgresConfig();
  EXPECT_NE(dynamic_cast<PostgresAdapter *>(DatabaseAdapter::build(pg, td.dir, runner).get()), nullptr);
  pg.adapter = "PostgreSQL";
  EXPECT_NE(dynamic_cast<PostgresAdapter *>(DatabaseAdapter::build(pg, td.dir, runner).get()), nullptr);
  EXPECT_NE(dynamic_cast<MySQLAdapter *>(DatabaseAdapter::build(MySQLConfig(), td.dir, runner).get()), nullptr);
}

TEST(DatabaseAdapter, Build_UnsupportedEngineThrows)
{
  TempDir td;
  FakeRunner runner;
  auto config = PostgresConfig();
  config.adapter = "sqlite";
  try
  {
    DatabaseAdapter::build(config, td.dir, runner);
    FAIL() << "expected UnsupportedAdapterError";
  }
  catch (const UnsupportedAdapterError &e)
  {
    EXPECT_EQ(e.adapterKind(), "sqlite");
  }
  EXPECT_TRUE(runner.commands.empty());
}

TEST(PostgresAdapter, Dump_WritesNamedFileWithPgDump)
{
  TempDir td;
  FakeRunner runner;
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);

  EXPECT_FALSE(adapter.dumpExists("feature/x"));
  ASSERT_TRUE(adapter.dump("feature/x"));
  ASSERT_EQ(runner.commands.size(), 1u);

  const auto &cmd = runner.commands[0];
  EXPECT_EQ(cmd.argv.front(), "pg_dump");
  EXPECT_EQ(cmd.argv.back(), "app_development");
  EXPECT_TRUE(Contains(cmd.argv, "--format=custom"));
  ASSERT_TRUE(cmd.stdoutFile);
  EXPECT_EQ(*cmd.stdoutFile, td.dir / "app_development-feature_x~partial");
  EXPECT_TRUE(adapter.dumpExists("feature/x"));
  EXPECT_NE(ReadAll(td.dir / "app_development-feature_x").find("pg_dump"), std::string::npos);
  EXPECT_FALSE(fs::exists(td.dir / "app_development-feature_x~partial"));
}

TEST(PostgresAdapter, Dump_FailureKeepsEarlierSnapshot)
{
  TempDir td;
  FakeRunner runner;
  // The dump tool writes some output and then dies.
  runner.onRun = [](const Command &c) {
    WriteAll(*c.stdoutFile, "truncated");
    return false;
  };
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);
  WriteAll(adapter.dumpPath("main"), "good snapshot");

  EXPECT_FALSE(adapter.dump("main"));
  EXPECT_TRUE(adapter.dumpExists("main"));
  EXPECT_EQ(ReadAll(adapter.dumpPath("main")), "good snapshot");
  EXPECT_FALSE(fs::exists(td.dir / "app_development-main~partial"));
}

TEST(PostgresAdapter, Dump_FailureWithoutEarlierSnapshotLeavesNoFile)
{
  TempDir td;
  FakeRunner runner;
  runner.onRun = [](const Command &) { return false; };
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);

  EXPECT_FALSE(adapter.dump("main"));
  EXPECT_FALSE(adapter.dumpExists("main"));
  EXPECT_TRUE(fs::is_empty(td.dir));
}

TEST(PostgresAdapter, Credentials_FlagsAndPasswordEnvironment)
{
  TempDir td;
  FakeRunner runner;
  auto config = PostgresConfig();
  config.user = "dev";
  config.password = "pw";
  config.host = "db.local";
  config.port = 5433;
  PostgresAdapter adapter(config, td.dir, runner);

  ASSERT_TRUE(adapter.dump("main"));
  const auto &cmd = runner.commands[0];
  EXPECT_TRUE(Contains(cmd.argv, "--username=dev"));
  EXPECT_TRUE(Contains(cmd.argv, "--host=db.local"));
  EXPECT_TRUE(Contains(cmd.argv, "--port=5433"));
  EXPECT_EQ(cmd.environment, std::vector<std::string>{"PGPASSWORD=pw"});
  EXPECT_EQ(describe(cmd).find("pw "), std::string::npos);
}

TEST(PostgresAdapter, Restore_RunsDrainDropCreateImportSequence)
{
  TempDir td;
  FakeRunner runner;
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);
  WriteAll(adapter.dumpPath("main"), "snapshot");

  ASSERT_TRUE(adapter.restore("main"));

  std::vector<std::string> expected = {"psql", "psql", "dropdb", "psql", "createdb", "psql", "psql", "pg_restore"};
  EXPECT_EQ(runner.programs(), expected);
  EXPECT_EQ(runner.countProgram("dropdb"), 1u);
  EXPECT_EQ(runner.countProgram("createdb"), 1u);

  EXPECT_NE(Join(runner.commands[0].argv).find("ALTER DATABASE \"app_development\" ALLOW_CONNECTIONS false"), std::string::npos);
  EXPECT_NE(Join(runner.commands[1].argv).find("pg_terminate_backend"), std::string::npos);
  EXPECT_NE(Join(runner.commands[1].argv).find("datname = 'app_development'"), std::string::npos);
  EXPECT_NE(Join(runner.commands[6].argv).find("ALLOW_CONNECTIONS true"), std::string::npos);

  const auto &importCommand = runner.commands.back();
  EXPECT_TRUE(Contains(importCommand.argv, "--dbname=app_development"));
  ASSERT_TRUE(importCommand.stdinFile);
  EXPECT_EQ(*importCommand.stdinFile, adapter.dumpPath("main"));

  const auto &steps = adapter.lastRestoreSteps();
  ASSERT_EQ(steps.size(), 8u);
  EXPECT_EQ(steps[2].description, "drop database");
  EXPECT_EQ(steps[4].description, "create database");
  EXPECT_EQ(steps[7].description, "import dump");
}

TEST(PostgresAdapter, Restore_IntermediateFailuresAreBestEffort)
{
  TempDir td;
  FakeRunner runner;
  runner.onRun = [](const Command &c) { return c.argv.front() != "psql"; };
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);
  WriteAll(adapter.dumpPath("main"), "snapshot");

  EXPECT_TRUE(adapter.restore("main"));
  EXPECT_EQ(runner.commands.size(), 8u);
  auto failed = std::ranges::count_if(adapter.lastRestoreSteps(), [](const RestoreStep &s) { return !s.succeeded; });
  EXPECT_EQ(failed, 5);
}

TEST(PostgresAdapter, Restore_ResultIsFinalImport)
{
  TempDir td;
  FakeRunner runner;
  runner.onRun = [](const Command &c) { return c.argv.front() != "pg_restore"; };
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);
  WriteAll(adapter.dumpPath("main"), "snapshot");

  EXPECT_FALSE(adapter.restore("main"));
  EXPECT_FALSE(adapter.lastRestoreSteps().back().succeeded);
}

TEST(PostgresAdapter, Restore_WithoutDumpTouchesNothing)
{
  TempDir td;
  FakeRunner runner;
  PostgresAdapter adapter(PostgresConfig(), td.dir, runner);

  EXPECT_FALSE(adapter.restore("never-saved"));
  EXPECT_TRUE(runner.commands.empty());
}

TEST(PostgresAdapter, CommandPrefixIsPrepended)
{
  TempDir td;
  FakeRunner runner;
  auto config = PostgresConfig();
  config.commandPrefix = {"docker", "compose", "exec", "-T", "db"};
  PostgresAdapter adapter(config, td.dir, runner);

  ASSERT_TRUE(adapter.terminateConnections("app_test"));
  const auto &argv = runner.commands[0].argv;
  ASSERT_GT(argv.size(), 6u);
  EXPECT_EQ(std::vector<std::string>(argv.begin(), argv.begin() + 6),
            (std::vector<std::string>{"docker", "compose", "exec", "-T", "db", "psql"}));
  EXPECT_NE(Join(argv).find("datname = 'app_test'"), std::string::npos);
}

TEST(PostgresAdapter, DatabaseNamesAreQuotedInSql)
{
  TempDir td;
  FakeRunner runner;
  auto config = PostgresConfig();
  config.database = "o'brien\"db";
  PostgresAdapter adapter(config, td.dir, runner);
  WriteAll(adapter.dumpPath("main"), "snapshot");

  ASSERT_TRUE(adapter.restore("main"));
  EXPECT_NE(Join(runner.commands[0].argv).find("\"o'brien\"\"db\""), std::string::npos);
  EXPECT_NE(Join(runner.commands[1].argv).find("'o''brien\"db'"), std::string::npos);
}

TEST(MySQLAdapter, DumpAndRestoreAreSingleRedirectedCommands)
{
  TempDir td;
  FakeRunner runner;
  MySQLAdapter adapter(MySQLConfig(), td.dir, runner);

  ASSERT_TRUE(adapter.dump("main"));
  ASSERT_TRUE(adapter.restore("main"));
  ASSERT_EQ(runner.commands.size(), 2u);

  const auto &dump = runner.commands[0];
  EXPECT_EQ(dump.argv, (std::vector<std::string>{"mysqldump", "-uroot", "-psecret", "shop"}));
  ASSERT_TRUE(dump.stdoutFile);
  EXPECT_EQ(*dump.stdoutFile, td.dir / "shop-main~partial");

  const auto &restore = runner.commands[1];
  EXPECT_EQ(restore.argv, (std::vector<std::string>{"mysql", "-uroot", "-psecret", "shop"}));
  ASSERT_TRUE(restore.stdinFile);
  EXPECT_EQ(*restore.stdinFile, td.dir / "shop-main");
  EXPECT_EQ(adapter.lastRestoreSteps().size(), 1u);
  EXPECT_EQ(describe(restore), "mysql -uroot -p*** shop < " + (td.dir / "shop-main").string());
}

TEST(MySQLAdapter, TerminateConnectionsIsNoOp)
{
  TempDir td;
  FakeRunner runner;
  MySQLAdapter adapter(MySQLConfig(), td.dir, runner);
  EXPECT_TRUE(adapter.terminateConnections("shop_test"));
  EXPECT_TRUE(runner.commands.empty());
}

TEST(DummyAdapter, DumpThenRestoreRoundTrips)
{
  TempDir td;
  FakeRunner runner;
  DummyAdapter adapter(PostgresConfig(), td.dir, runner);

  adapter.content = std::string("\x00\x01state-of-main\xFF", 16);
  EXPECT_FALSE(adapter.dumpExists("main"));
  ASSERT_TRUE(adapter.dump("main"));
  EXPECT_TRUE(adapter.dumpExists("main"));

  const std::string saved = adapter.content;
  adapter.content = "modified on feature";
  ASSERT_TRUE(adapter.restore("main"));
  EXPECT_EQ(adapter.content, saved);
  EXPECT_TRUE(runner.commands.empty());
}
