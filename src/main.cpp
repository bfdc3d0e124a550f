#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "Errors.hpp"
#include "Digest/OpenSslDigestRegistry.hpp"
#include "Gate/DedupGate.hpp"
#include "Store/VaultStore.hpp"

using namespace Hashgate;

namespace
{
  constexpr int EXIT_USAGE = 1;
  constexpr int EXIT_DUPLICATE = 2;
  constexpr int EXIT_ERROR = 3;
}

/// @brief Parse command line arguments to easy-to-use map.
/// @param argc count of the arguments
/// @param argv argument array.
/// @return
std::unordered_map<std::string_view, std::string_view> parseArgs(int argc, char *argv[])
{
  std::unordered_map<std::string_view, std::string_view> opts;
  for (int i = 1; i < argc; ++i)
  {
    std::string_view arg = argv[i];
    if (arg.starts_with("--"))
    {
      if (i + 1 < argc && !std::string_view(argv[i + 1]).starts_with("--"))
        opts[arg.substr(2)] = argv[++i];
      else
        opts[arg.substr(2)] = "true"; // flag
    }
  }
  return opts;
}

void Usage(std::string programName)
{
  std::cout << "USAGE:" << std::endl;
  std::cout << " - Hash a file:         " << programName << " --archive <dir> --hash <file> [--algorithm SHA-256] [--window <bytes>]" << std::endl;
  std::cout << " - Ingest a file:       " << programName << " --archive <dir> --ingest <file> [--name <name>] [--meta k=v,k2=v2] [--auto-rewind]" << std::endl;
  std::cout << " - Fetch a blob:        " << programName << " --archive <dir> --fetch <id> --out <file>" << std::endl;
  std::cout << " - Delete a blob:       " << programName << " --archive <dir> --delete <id>" << std::endl;
  std::cout << " - Show blob info:      " << programName << " --archive <dir> --info <id>" << std::endl;
  std::cout << " - List blobs:          " << programName << " --archive <dir> --list [--filename <name>] [--where k=v] [--from YYYY-MM-DD] [--to YYYY-MM-DD]" << std::endl;
  std::cout << "                        [--limit n] [--skip n] [--sort id|filename|length|date[,...]] [--desc]" << std::endl;
  std::cout << " - Count blobs:         " << programName << " --archive <dir> --count" << std::endl;
  std::cout << "Options: --level <zstd level> (default 3)" << std::endl;
}

/// @brief Parses a decimal integer option.
template <typename T>
T ParseNumber(std::string_view name, std::string_view text)
{
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size())
    throw InvalidArgument("--" + std::string(name) + " expects a number, got '" + std::string(text) + "'");
  return value;
}

/// @brief Parses "k=v,k2=v2" into metadata.
Metadata ParseMeta(std::string_view text)
{
  Metadata meta;
  while (!text.empty())
  {
    const auto comma = text.find(',');
    const auto pair = text.substr(0, comma);
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0)
      throw InvalidArgument("--meta expects k=v pairs, got '" + std::string(pair) + "'");

    meta[std::string(pair.substr(0, eq))] = std::string(pair.substr(eq + 1));
    text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
  }
  return meta;
}

Store::SortField ParseSortField(std::string_view text)
{
  if (text == "id")
    return Store::SortField::Id;
  if (text == "filename")
    return Store::SortField::Filename;
  if (text == "length")
    return Store::SortField::Length;
  if (text == "date")
    return Store::SortField::UploadDate;
  throw InvalidArgument("--sort expects id, filename, length or date, got '" + std::string(text) + "'");
}

/// @brief Parses "filename,length" into sort keys in priority order.
std::vector<Store::SortField> ParseSort(std::string_view text)
{
  std::vector<Store::SortField> fields;
  while (!text.empty())
  {
    const auto comma = text.find(',');
    fields.push_back(ParseSortField(text.substr(0, comma)));
    text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
  }
  return fields;
}

/// @brief Parses a UTC calendar day "YYYY-MM-DD" to its first millisecond.
std::chrono::system_clock::time_point ParseDay(std::string_view name, std::string_view text)
{
  std::tm tm{};
  std::istringstream in{std::string(text)};
  in >> std::get_time(&tm, "%Y-%m-%d");
  if (in.fail() || in.peek() != std::char_traits<char>::eof())
    throw InvalidArgument("--" + std::string(name) + " expects YYYY-MM-DD, got '" + std::string(text) + "'");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

void PrintInfo(const Store::BlobInfo &info)
{
  const std::time_t t = std::chrono::system_clock::to_time_t(info.UploadDate);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::cout << info.Id << "  " << info.Filename << "  " << info.Length << " bytes  "
            << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << "  "
            << info.Algorithm << ":" << info.Digest << std::endl;
  for (const auto &[key, value] : info.Extra)
    std::cout << "    " << key << " = " << value << std::endl;
}

int Run(std::unordered_map<std::string_view, std::string_view> &args)
{
  auto registry = std::make_shared<Digest::OpenSslDigestRegistry>();
  auto digests = std::make_shared<Digest::ChunkedDigestComputer>(registry);

  Gate::GateConfig gateConfig;
  if (args.contains("algorithm"))
    gateConfig.Algorithm = std::string(args["algorithm"]);
  if (args.contains("window"))
    gateConfig.WindowSize = ParseNumber<std::int64_t>("window", args["window"]);
  gateConfig.AutoRewind = args.contains("auto-rewind");

  if (args.contains("hash"))
  {
    const std::filesystem::path file(args["hash"]);
    std::cout << digests->Compute(file, gateConfig.Algorithm, gateConfig.WindowSize) << "  " << file.string() << std::endl;
    return 0;
  }

  Store::VaultConfig vaultConfig;
  vaultConfig.Root = std::filesystem::path(args["archive"]);
  if (args.contains("level"))
    vaultConfig.CompressionLevel = ParseNumber<int>("level", args["level"]);

  std::shared_ptr<Store::VaultStore> vault = Store::VaultStore::Open(vaultConfig, registry);

  if (args.contains("ingest"))
  {
    const std::filesystem::path file(args["ingest"]);
    const std::string name = args.contains("name") ? std::string(args["name"]) : file.filename().string();
    const Metadata meta = args.contains("meta") ? ParseMeta(args["meta"]) : Metadata{};

    Gate::DedupGate gate(vault, digests, gateConfig);
    std::cout << "Uploading '" << file.string() << "'..." << std::endl;
    const ID id = gate.Ingest(file, name, meta);
    std::cout << id << std::endl;
    return 0;
  }

  if (args.contains("fetch"))
  {
    if (!args.contains("out"))
      throw InvalidArgument("--fetch needs --out <file>");
    vault->FetchToFile(ParseNumber<ID>("fetch", args["fetch"]), std::filesystem::path(args["out"]));
    return 0;
  }

  if (args.contains("delete"))
  {
    vault->Delete(ParseNumber<ID>("delete", args["delete"]));
    return 0;
  }

  if (args.contains("info"))
  {
    PrintInfo(vault->Info(ParseNumber<ID>("info", args["info"])));
    return 0;
  }

  if (args.contains("list"))
  {
    Store::ListQuery query;
    if (args.contains("filename"))
      query.Filename = std::string(args["filename"]);
    if (args.contains("where"))
    {
      const Metadata match = ParseMeta(args["where"]);
      if (match.size() != 1)
        throw InvalidArgument("--where expects a single k=v pair");
      query.MetadataEquals = Store::MetadataMatch{match.begin()->first, match.begin()->second};
    }
    // Both days are included in full.
    if (args.contains("from"))
      query.From = ParseDay("from", args["from"]);
    if (args.contains("to"))
      query.To = ParseDay("to", args["to"]) + std::chrono::hours(24) - std::chrono::milliseconds(1);
    if (args.contains("limit"))
      query.Limit = ParseNumber<std::size_t>("limit", args["limit"]);
    if (args.contains("skip"))
      query.Skip = ParseNumber<std::size_t>("skip", args["skip"]);
    if (args.contains("sort"))
      query.Sort = ParseSort(args["sort"]);
    query.Descending = args.contains("desc");

    for (const auto &info : vault->List(query))
      PrintInfo(info);
    return 0;
  }

  if (args.contains("count"))
  {
    std::cout << vault->Count() << std::endl;
    return 0;
  }

  throw InvalidArgument("no action given");
}

int main(int argc, char *argv[])
{

  auto args = parseArgs(argc, argv);

  if (!args.contains("archive") && !args.contains("hash"))
  {
    Usage(argv[0]);
    return EXIT_USAGE;
  }

  try
  {
    return Run(args);
  }
  catch (const InvalidArgument &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    Usage(argv[0]);
    return EXIT_USAGE;
  }
  catch (const DuplicateContent &e)
  {
    std::cerr << e.what();
    if (e.ExistingId())
      std::cerr << " (ID: " << *e.ExistingId() << ")";
    std::cerr << std::endl;
    return EXIT_DUPLICATE;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_ERROR;
  }
}
