// English: DumpCatalog + SqlScript test suite (classification, names, walk, splitting).
//          No GTest dependency - uses std::cout.
// 한글: DumpCatalog + SqlScript 테스트 (분류, 이름, 탐색, 분리).
//       GTest 미사용, std::cout 기반.

#include "../Common/TempDumpDir.h"
#include "Interfaces/RestoreException.h"
#include "Restore/DumpCatalog.h"
#include "Restore/SqlScript.h"
#include "Utils/Logger.h"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace DumpLoader::Restore;
using DumpLoader::Tests::TempDumpDir;

static int gPassed = 0, gFailed = 0;

static void Pass(const char *name)
{
    std::cout << "[PASS] " << name << "\n";
    ++gPassed;
}

static void Fail(const char *name, const std::string &reason)
{
    std::cout << "[FAIL] " << name << " - " << reason << "\n";
    ++gFailed;
}

// -----------------------------------------------------------------------
void TestClassifyPriority()
{
    const char *name = "ClassifyPriority";
    TempDumpDir dir("classify");
    const std::string db = dir.Write("a-schema-create.sql", "CREATE DATABASE a");
    const std::string schema = dir.Write("a.b-schema.sql", "CREATE TABLE b (id INT)");
    const std::string table = dir.Write("a.b.sql", "INSERT INTO b VALUES (1)");
    const std::string part = dir.Write("a.b.1.sql", "INSERT INTO b VALUES (2)");
    dir.Write("readme.txt", "not a dump file");

    DumpFileSet files = DumpCatalog::Load(dir.Path());
    if (files.mDatabases != std::vector<std::string>{db})
        Fail(name, "databases mismatch");
    else if (files.mSchemas != std::vector<std::string>{schema})
        Fail(name, "schemas mismatch");
    else if (files.mTables != std::vector<std::string>{part, table})
        Fail(name, "tables mismatch (expected lexical walk order)");
    else if (files.GetTotalCount() != 4)
        Fail(name, "readme.txt must be dropped");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestClassifyByFileNameOnly()
{
    const char *name = "ClassifyByFileNameOnly";
    if (DumpCatalog::Classify("/d/x-schema-create.sql/a.txt") != FileCategory::Ignored)
        Fail(name, "directory part must not affect classification");
    else if (DumpCatalog::Classify("/d/x-schema-create.sql") != FileCategory::DatabaseSchema)
        Fail(name, "database suffix");
    else if (DumpCatalog::Classify("/d/x.y-schema.sql") != FileCategory::TableSchema)
        Fail(name, "schema suffix");
    else if (DumpCatalog::Classify("/d/x.y.sql") != FileCategory::TableData)
        Fail(name, "data suffix");
    else if (DumpCatalog::Classify("/d/x.y.sql.gz") != FileCategory::Ignored)
        Fail(name, "compressed files are not data files");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestLiteralSuffixRemoval()
{
    const char *name = "LiteralSuffixRemoval";
    const TableIdentity schema = DumpCatalog::ParseTableSchemaIdentity("/d/shop.sales-schema.sql");
    const TableIdentity data = DumpCatalog::ParseTableIdentity("/d/db.qls.sql");
    const TableIdentity lq = DumpCatalog::ParseTableIdentity("/d/lq.sql.sql");

    if (schema.mDatabase != "shop" || schema.mTable != "sales")
        Fail(name, "schema name trimmed as a character set: " + schema.mDatabase + "." + schema.mTable);
    else if (data.mDatabase != "db" || data.mTable != "qls")
        Fail(name, "data name trimmed as a character set: " + data.mTable);
    else if (lq.mDatabase != "lq" || lq.mTable != "sql")
        Fail(name, "suffix must be removed once: " + lq.mTable);
    else if (DumpCatalog::ParseDatabaseName("/d/sql-schema-create.sql") != "sql")
        Fail(name, "database name");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestTableIdentityParts()
{
    const char *name = "TableIdentityParts";
    const TableIdentity sharded = DumpCatalog::ParseTableIdentity("/d/shop.orders.00042.sql");
    const TableIdentity single = DumpCatalog::ParseTableIdentity("/d/shop.orders.sql");

    if (sharded.mDatabase != "shop" || sharded.mTable != "orders" || sharded.mPart != "00042")
        Fail(name, "sharded identity");
    else if (sharded.GetPartLabel() != "00042")
        Fail(name, "sharded label");
    else if (!single.mPart.empty() || single.GetPartLabel() != "0")
        Fail(name, "unsharded file must log part 0");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestMalformedTableName()
{
    const char *name = "MalformedTableName";
    try
    {
        DumpCatalog::ParseTableIdentity("/d/orders.sql");
        Fail(name, "expected RestoreException");
    }
    catch (const RestoreException &e)
    {
        if (e.GetContext().mFile != "/d/orders.sql")
            Fail(name, "exception must carry the file path");
        else if (std::string(e.what()).find("orders.sql") == std::string::npos)
            Fail(name, "message must name the file");
        else
            Pass(name);
    }
}

// -----------------------------------------------------------------------
void TestRecursiveWalkOrder()
{
    const char *name = "RecursiveWalkOrder";
    TempDumpDir dir("walk");
    const std::string a = dir.Write("a.t.sql", "x");
    const std::string nested = dir.Write("b/a.u.sql", "x");
    const std::string deeper = dir.Write("b/c/a.v.sql", "x");
    const std::string c = dir.Write("c.t.sql", "x");
    const std::string dbA = dir.Write("a-schema-create.sql", "x");
    const std::string dbZ = dir.Write("z/z-schema-create.sql", "x");
    dir.MakeDir("empty.sql");

    DumpFileSet files = DumpCatalog::Load(dir.Path());
    const std::vector<std::string> expectedTables{a, nested, deeper, c};
    const std::vector<std::string> expectedDatabases{dbA, dbZ};

    if (files.mTables != expectedTables)
        Fail(name, "tables not in lexical depth-first order");
    else if (files.mDatabases != expectedDatabases)
        Fail(name, "databases not in walk order");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestMissingDirectory()
{
    const char *name = "MissingDirectory";
    TempDumpDir dir("missing");
    const std::string missing = dir.PathOf("does-not-exist");
    try
    {
        DumpCatalog::Load(missing);
        Fail(name, "expected RestoreException");
    }
    catch (const RestoreException &e)
    {
        if (e.GetContext().mFile != missing)
            Fail(name, "exception must carry the directory path");
        else
            Pass(name);
    }
}

// -----------------------------------------------------------------------
void TestDanglingSymlinkIgnored()
{
    const char *name = "DanglingSymlinkIgnored";
    TempDumpDir dir("dangling");
    const std::string table = dir.Write("a.t.sql", "x");
    const std::string target = dir.Write("real.t.sql", "x");
    std::filesystem::create_symlink(dir.PathOf("gone.log"), dir.PathOf("latest.log"));
    std::filesystem::create_symlink(target, dir.PathOf("b.linked.sql"));

    try
    {
        DumpFileSet files = DumpCatalog::Load(dir.Path());
        const std::vector<std::string> expected{table, dir.PathOf("b.linked.sql"), target};
        if (files.mTables != expected)
            Fail(name, "symlinked data file must be kept, dangling non-dump link skipped");
        else
            Pass(name);
    }
    catch (const RestoreException &e)
    {
        Fail(name, std::string("walk failed: ") + e.what());
    }
}

// -----------------------------------------------------------------------
void TestExceptionWithoutContext()
{
    const char *name = "ExceptionWithoutContext";
    const RestoreException bare("no files to restore");

    RestoreException::Context context;
    context.mDatabase = "shop";
    context.mTable = "orders";
    context.mPart = "2";
    context.mConnectionId = 7;
    const RestoreException full("boom", context);

    if (std::string(bare.what()) != "restore.failed: no files to restore")
        Fail(name, std::string("bare message: ") + bare.what());
    else if (bare.GetContext().mConnectionId != 0 || !bare.GetContext().mFile.empty())
        Fail(name, "bare exception must have an empty context");
    else if (std::string(full.what()) != "restore.failed.database[shop].table[orders].part[2].conn[7]: boom")
        Fail(name, std::string("full message: ") + full.what());
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestSplitStatements()
{
    const char *name = "SplitStatements";
    const std::string text =
        "/*!40101 SET NAMES binary*/;\n"
        "CREATE TABLE `t` (\n  `id` int NOT NULL\n) ENGINE=InnoDB;\n"
        "CREATE INDEX i ON t(id);\n"
        "\n";
    const auto statements = SqlScript::SplitStatements(text);

    if (statements.size() != 2)
        Fail(name, "expected 2 statements, got " + std::to_string(statements.size()));
    else if (statements[0] != "CREATE TABLE `t` (\n  `id` int NOT NULL\n) ENGINE=InnoDB")
        Fail(name, "first statement: " + statements[0]);
    else if (statements[1] != "CREATE INDEX i ON t(id)")
        Fail(name, "second statement: " + statements[1]);
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestSplitOnlyOnSemicolonNewline()
{
    const char *name = "SplitOnlyOnSemicolonNewline";
    const auto statements = SqlScript::SplitStatements("INSERT INTO t VALUES ('a;b');INSERT INTO t VALUES (2)");
    const auto noTrailing = SqlScript::SplitStatements("INSERT INTO t VALUES (1);\nINSERT INTO t VALUES (2);");

    if (statements.size() != 1)
        Fail(name, "a semicolon without newline must not split");
    else if (noTrailing.size() != 2 || noTrailing[1] != "INSERT INTO t VALUES (2);")
        Fail(name, "last piece keeps its unmatched semicolon");
    else if (SqlScript::IsExecutable("  \n\t") || SqlScript::IsExecutable("/* comment */"))
        Fail(name, "blank and comment pieces are not executable");
    else if (!SqlScript::IsExecutable(" /* leading space */ SELECT 1"))
        Fail(name, "only a piece that starts with the comment marker is skipped");
    else
        Pass(name);
}

// -----------------------------------------------------------------------
void TestReadFile()
{
    const char *name = "ReadFile";
    TempDumpDir dir("read");
    const std::string content("INSERT INTO t VALUES ('\0');\n", 28);
    const std::string path = dir.Write("a.t.sql", content);

    const std::string read = SqlScript::ReadFile(path);
    if (read != content)
    {
        Fail(name, "content mismatch (binary read)");
        return;
    }

    try
    {
        SqlScript::ReadFile(dir.PathOf("nope.sql"));
        Fail(name, "expected RestoreException for a missing file");
    }
    catch (const RestoreException &e)
    {
        if (e.GetContext().mFile.find("nope.sql") == std::string::npos)
            Fail(name, "exception must carry the file path");
        else
            Pass(name);
    }
}

// -----------------------------------------------------------------------
int main()
{
    DumpLoader::Utils::Logger::SetLevel(DumpLoader::Utils::LogLevel::Warn);

    std::cout << "=== DumpCatalog Tests ===\n";
    TestClassifyPriority();
    TestClassifyByFileNameOnly();
    TestLiteralSuffixRemoval();
    TestTableIdentityParts();
    TestMalformedTableName();
    TestRecursiveWalkOrder();
    TestMissingDirectory();
    TestDanglingSymlinkIgnored();
    TestExceptionWithoutContext();
    TestSplitStatements();
    TestSplitOnlyOnSemicolonNewline();
    TestReadFile();

    std::cout << "\nResult: " << gPassed << " passed, " << gFailed << " failed\n";
    return gFailed > 0 ? 1 : 0;
}
