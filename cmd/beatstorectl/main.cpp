#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/http/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using beatstore::service::CatalogService;

static void Usage() {
  std::cout << "Usage:\n"
            << "  beatstorectl [--config <config.yaml>] sync\n"
            << "  beatstorectl [--config <config.yaml>] list\n"
            << "  beatstorectl [--config <config.yaml>] show <beat_id>\n"
            << "  beatstorectl [--config <config.yaml>] add <file_name> [title] [genre] [bpm]\n"
            << "  beatstorectl [--config <config.yaml>] inquiries [beat_id]\n"
            << "  beatstorectl [--config <config.yaml>] set-status <inquiry_id> <status>\n";
}

static std::optional<int64_t> ParseId(std::string_view text) {
  int64_t     value = 0;
  const auto* last  = text.data() + text.size();
  auto [end, ec]    = std::from_chars(text.data(), last, value);
  if (text.empty() || ec != std::errc() || end != last) {
    return std::nullopt;
  }
  return value;
}

static std::string OrDash(const std::optional<std::string>& value) {
  return value ? *value : "-";
}

static std::string OrDash(const std::optional<int64_t>& value) {
  return value ? std::to_string(*value) : "-";
}

static int RunSync(CatalogService& catalog) {
  const auto report = catalog.Sync();
  if (!report.directory_available) {
    std::cerr << "beats folder unavailable\n";
    return 2;
  }
  std::cout << "considered=" << report.considered << "\n";
  std::cout << "inserted=" << report.inserted << "\n";
  std::cout << "skipped=" << report.skipped << "\n";
  std::cout << "failed=" << report.failures.size() << "\n";
  for (const auto& failure : report.failures) {
    std::cout << "  " << failure.file_name << ": " << failure.error_message << "\n";
  }
  return 0;
}

static int RunList(CatalogService& catalog) {
  for (const auto& view : catalog.ListBeats()) {
    const auto& beat = view.beat;
    std::cout << beat.id << "\t" << beat.slug << "\t" << beat.file_name << "\t" << OrDash(beat.genre) << "\t"
              << OrDash(beat.bpm) << "\t" << beatstore::util::FormatUnixMillis(beat.created_at_ms) << "\n";
  }
  return 0;
}

static int RunAdd(CatalogService& catalog, const std::vector<std::string>& args) {
  beatstore::db::model::BeatRecord record;
  record.file_name = args[0];
  if (args.size() >= 2) record.title = args[1];
  if (args.size() >= 3 && !args[2].empty()) record.genre = args[2];
  if (args.size() >= 4) {
    auto bpm = ParseId(args[3]);
    if (!bpm) {
      std::cerr << "invalid bpm: " << args[3] << "\n";
      return 1;
    }
    record.bpm = *bpm;
  }

  const auto view = catalog.AddBeat(std::move(record));
  std::cout << "id=" << view.beat.id << "\n";
  std::cout << "slug=" << view.beat.slug << "\n";
  return 0;
}

static int RunInquiries(CatalogService& catalog, std::optional<int64_t> beat_id) {
  for (const auto& inquiry : catalog.ListInquiries(beat_id)) {
    std::cout << inquiry.id << "\tbeat=" << inquiry.beat_id << "\t" << inquiry.status << "\t" << inquiry.name << " <"
              << inquiry.email << ">\t" << inquiry.offer << "\t"
              << beatstore::util::FormatUnixMillis(inquiry.created_at_ms) << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  args.erase(args.begin());

  try {
    auto config = beatstore::config::ConfigLoader::Load(config_path);
    // Admin commands print their own results; keep the log to problems.
    if (config.logging().level() == "info") {
      config.mutable_logging()->set_level("warn");
    }
    beatstore::observability::InitializeLogging(config);

    auto  app     = beatstore::factory::Build(config);
    auto& catalog = *app.catalog_service;

    int rc = 1;
    if (cmd == "sync") {
      rc = RunSync(catalog);
    } else if (cmd == "list") {
      rc = RunList(catalog);
    } else if (cmd == "show") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }
      std::cout << beatstore::http::BeatJson(catalog.GetBeat(args[0])) << "\n";
      rc = 0;
    } else if (cmd == "add") {
      if (args.empty() || args.size() > 4) {
        Usage();
        return 1;
      }
      rc = RunAdd(catalog, args);
    } else if (cmd == "inquiries") {
      std::optional<int64_t> beat_id;
      if (!args.empty()) {
        beat_id = ParseId(args[0]);
        if (!beat_id) {
          std::cerr << "invalid beat id: " << args[0] << "\n";
          return 1;
        }
      }
      rc = RunInquiries(catalog, beat_id);
    } else if (cmd == "set-status") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }
      const auto inquiry_id = ParseId(args[0]);
      if (!inquiry_id) {
        std::cerr << "invalid inquiry id: " << args[0] << "\n";
        return 1;
      }
      catalog.UpdateInquiryStatus(*inquiry_id, args[1]);
      std::cout << "updated\n";
      rc = 0;
    } else {
      Usage();
    }

    beatstore::observability::ShutdownLogging();
    return rc;
  } catch (const beatstore::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const beatstore::util::InvalidArgument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
  } catch (const beatstore::util::AlreadyExists& e) {
    std::cerr << "already exists: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }

  beatstore::observability::ShutdownLogging();
  return 2;
}
