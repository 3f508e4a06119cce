#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/duration.hpp"
#include "internal/util/errors.hpp"

using pagewise::model::Medium;
using pagewise::model::ProgressKey;
using pagewise::model::ProgressSnapshot;
using pagewise::util::Date;
using pagewise::util::DateRange;
using pagewise::util::Decimal;

static void Usage() {
  std::cerr << "Usage: pagewisectl [--config <file.yaml>] [--context <id>] [--date YYYY-MM-DD] <command> ...\n"
            << "  report <reader> <book> <paper|ebook|audio> <page|HH:MM:SS>\n"
            << "  listen <reader> <book> <seconds|HH:MM:SS>\n"
            << "  finish <reader> <book>\n"
            << "  activate <reader> <book> <medium> [--pages N] [--length HH:MM:SS] [--speed X] [--position N]\n"
            << "  deactivate <reader> <book> <medium>\n"
            << "  set-pages <reader> <book> <pages|none>\n"
            << "  set-speed <reader> <book> <speed>\n"
            << "  show <reader> <book>\n"
            << "  list <reader>\n"
            << "  daily <reader> <from> <to>\n"
            << "  summary <reader> <day|week|month|year> <anchor>\n"
            << "  summary <reader> <from> <to>\n"
            << "  calendar <reader> <year> <month>\n"
            << "  streaks <reader> <from> <to>\n"
            << "  books <reader> <from> <to>\n"
            << "  leaderboard <from> <to> [limit]\n"
            << "  forecast <reader> <book>\n";
}

namespace {

struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  std::optional<std::string> Option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

Args Parse(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    if (token.rfind("--", 0) == 0) {
      if (i + 1 >= argc) throw std::invalid_argument("missing value for " + token);
      args.options[token.substr(2)] = argv[++i];
    } else {
      args.positional.push_back(std::move(token));
    }
  }
  return args;
}

Medium ParseMediumArg(const std::string& value) {
  auto medium = pagewise::model::ParseMedium(value);
  if (!medium) throw std::invalid_argument("unknown medium: " + value);
  return *medium;
}

std::int64_t ParseInt(const std::string& value) {
  std::size_t used   = 0;
  const auto  parsed = std::stoll(value, &used);
  if (used != value.size()) throw std::invalid_argument("not an integer: " + value);
  return parsed;
}

// Audio positions accept "HH:MM:SS"; page numbers are plain integers.
std::int64_t ParseRaw(Medium medium, const std::string& value) {
  if (medium == Medium::kAudio) return pagewise::util::ParseDuration(value).count();
  return ParseInt(value);
}

std::string Opt(const std::optional<std::int64_t>& value) {
  return value ? std::to_string(*value) : "unknown";
}

std::string Opt(const std::optional<Decimal>& value) {
  return value ? value->ToString() : "-";
}

void Print(const ProgressSnapshot& s) {
  std::cout << "progress_id=" << s.progress_id << " key=" << s.key.ToString() << " state=" << pagewise::model::ToString(s.state)
            << " percent=" << s.percent.ToString() << " current_page=" << Opt(s.current_page) << " total_pages=" << Opt(s.total_pages)
            << " pages_left=" << Opt(s.pages_left) << " ledger_delta=" << s.ledger_delta.ToString();
  if (s.notice) std::cout << " notice=" << pagewise::util::ToString(*s.notice);
  std::cout << "\n";
  for (const auto& m : s.media) {
    std::cout << "  " << pagewise::model::ToString(m.medium) << " raw=" << m.raw_value << " total=" << Opt(m.total)
              << " percent=" << Opt(m.percent) << " pages_equivalent=" << Opt(m.pages_equivalent);
    if (m.playback_speed) std::cout << " speed=" << m.playback_speed->ToString();
    std::cout << "\n";
  }
}

void PrintMedia(const pagewise::stats::MediumTotals& totals) {
  for (const auto& [medium, pages] : totals) std::cout << " " << pagewise::model::ToString(medium) << "=" << pages.ToString();
}

DateRange RangeArg(const Args& args, std::size_t first) {
  return {pagewise::util::ParseDate(args.positional.at(first)), pagewise::util::ParseDate(args.positional.at(first + 1))};
}

int Run(const Args& args) {
  if (args.positional.empty()) {
    Usage();
    return 1;
  }

  auto config = args.Option("config") ? pagewise::config::ConfigLoader::LoadFromYaml(*args.Option("config"))
                                      : pagewise::config::ConfigLoader::LoadFromYamlString("");
  pagewise::observability::InitializeLogging(config.logging());

  auto deps = pagewise::factory::Build(config);

  const auto& engine_options = deps.engine->options();
  auto        at             = pagewise::util::Now();
  if (auto date = args.Option("date")) at = pagewise::util::AtLocalNoon(pagewise::util::ParseDate(*date), engine_options.utc_offset);

  const auto& cmd = args.positional[0];
  const auto  n   = args.positional.size();
  auto        key = [&]() { return ProgressKey{args.positional.at(1), args.positional.at(2), args.Option("context").value_or("")}; };

  // ------------------------------------------------------------

  if (cmd == "report" && n == 5) {
    const auto medium = ParseMediumArg(args.positional[3]);
    Print(deps.engine->ReportProgress(key(), medium, ParseRaw(medium, args.positional[4]), at));
    return 0;
  }

  if (cmd == "listen" && n == 4) {
    Print(deps.engine->ReportListening(key(), pagewise::util::ParseDuration(args.positional[3]).count(), at));
    return 0;
  }

  if (cmd == "finish" && n == 3) {
    Print(deps.engine->MarkFinished(key(), at));
    return 0;
  }

  if (cmd == "activate" && n == 4) {
    const auto                     medium = ParseMediumArg(args.positional[3]);
    pagewise::core::MediumSettings settings;
    if (auto v = args.Option("pages")) settings.total_pages = ParseInt(*v);
    if (auto v = args.Option("length")) settings.length_seconds = pagewise::util::ParseDuration(*v).count();
    if (auto v = args.Option("speed")) settings.playback_speed = Decimal::Parse(*v);
    if (auto v = args.Option("position")) settings.position = ParseRaw(medium, *v);
    Print(deps.engine->ActivateFormat(key(), medium, settings, at));
    return 0;
  }

  if (cmd == "deactivate" && n == 4) {
    Print(deps.engine->DeactivateFormat(key(), ParseMediumArg(args.positional[3]), at));
    return 0;
  }

  if (cmd == "set-pages" && n == 4) {
    std::optional<std::int64_t> pages;
    if (args.positional[3] != "none") pages = ParseInt(args.positional[3]);
    Print(deps.engine->SetCustomTotalPages(key(), pages, at));
    return 0;
  }

  if (cmd == "set-speed" && n == 4) {
    Print(deps.engine->SetPlaybackSpeed(key(), Decimal::Parse(args.positional[3]), at));
    return 0;
  }

  if (cmd == "show" && n == 3) {
    auto snapshot = deps.engine->GetProgress(key());
    if (!snapshot) {
      std::cout << "state=unstarted\n";
      return 0;
    }
    Print(*snapshot);
    return 0;
  }

  if (cmd == "list" && n == 2) {
    for (const auto& s : deps.engine->ListProgress(args.positional[1])) Print(s);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "daily" && n == 4) {
    for (const auto& day : deps.aggregator->DailyTotals(args.positional[1], RangeArg(args, 2))) {
      std::cout << pagewise::util::FormatDate(day.date) << " pages=" << day.pages.ToString() << " audio_seconds=" << day.audio_seconds;
      PrintMedia(day.pages_by_medium);
      std::cout << " books=" << day.books.size() << "\n";
    }
    return 0;
  }

  if (cmd == "summary" && n == 4) {
    pagewise::stats::PeriodSummary summary;
    const auto&                    what = args.positional[2];
    if (what == "day" || what == "week" || what == "month" || what == "year") {
      const auto period = what == "day"    ? pagewise::stats::Period::kDay
                          : what == "week" ? pagewise::stats::Period::kWeek
                          : what == "month" ? pagewise::stats::Period::kMonth
                                            : pagewise::stats::Period::kYear;
      summary = deps.aggregator->Summary(args.positional[1], period, pagewise::util::ParseDate(args.positional[3]));
    } else {
      summary = deps.aggregator->Summary(args.positional[1], RangeArg(args, 2));
    }
    std::cout << "from=" << pagewise::util::FormatDate(summary.range.from) << " to=" << pagewise::util::FormatDate(summary.range.to)
              << " total_pages=" << summary.total_pages.ToString() << " reading_days=" << summary.reading_days
              << " average=" << Opt(summary.average_pages_per_day) << " audio_seconds=" << summary.audio_seconds
              << " books_completed=" << summary.books_completed;
    if (summary.best_day) {
      std::cout << " best_day=" << pagewise::util::FormatDate(summary.best_day->date) << ":" << summary.best_day->pages.ToString();
    }
    PrintMedia(summary.pages_by_medium);
    std::cout << "\n";
    return 0;
  }

  if (cmd == "calendar" && n == 4) {
    const auto calendar = deps.aggregator->Calendar(args.positional[1], static_cast<int>(ParseInt(args.positional[2])),
                                                    static_cast<unsigned>(ParseInt(args.positional[3])));
    std::cout << "Mo Tu We Th Fr Sa Su\n";
    for (const auto& week : calendar.weeks) {
      for (const auto& cell : week) {
        if (!cell.in_month) {
          std::cout << " . ";
        } else if (cell.completed) {
          std::cout << " * ";
        } else {
          std::cout << (cell.pages.IsZero() && cell.audio_minutes == 0 ? " - " : " # ");
        }
      }
      std::cout << "\n";
    }
    for (const auto& cell : calendar.days) {
      if (cell.pages.IsZero() && cell.audio_minutes == 0 && !cell.completed) continue;
      std::cout << pagewise::util::FormatDate(cell.date) << " pages=" << cell.pages.ToString() << " audio_minutes=" << cell.audio_minutes
                << " books=" << cell.books.size() << (cell.completed ? " completed" : "") << "\n";
    }
    return 0;
  }

  if (cmd == "streaks" && n == 4) {
    const auto streaks = deps.aggregator->StreaksFor(args.positional[1], RangeArg(args, 2));
    auto       show    = [](const char* name, const std::optional<pagewise::stats::Run>& run) {
      std::cout << name << "=";
      if (run) {
        std::cout << run->days << " (" << pagewise::util::FormatDate(run->from) << ".." << pagewise::util::FormatDate(run->to) << ")";
      } else {
        std::cout << 0;
      }
      std::cout << "\n";
    };
    show("longest_active", streaks.longest_active);
    show("longest_idle", streaks.longest_idle);
    std::cout << "current=" << streaks.current << "\n";
    return 0;
  }

  if (cmd == "books" && n == 4) {
    for (const auto& book : deps.aggregator->BookBreakdown(args.positional[1], RangeArg(args, 2))) {
      std::cout << book.book_id << " pages=" << book.pages.ToString() << " audio_seconds=" << book.audio_seconds
                << " reading_days=" << book.reading_days << "\n";
    }
    return 0;
  }

  if (cmd == "leaderboard" && (n == 3 || n == 4)) {
    const std::size_t limit = n == 4 ? static_cast<std::size_t>(ParseInt(args.positional[3])) : 10;
    for (const auto& entry : deps.aggregator->Leaderboard(RangeArg(args, 1), limit)) {
      std::cout << entry.rank << ". " << entry.reader_id << " pages=" << entry.pages.ToString() << " reading_days=" << entry.reading_days
                << "\n";
    }
    return 0;
  }

  if (cmd == "forecast" && n == 3) {
    const auto forecast = deps.aggregator->ForecastFor(key());
    std::cout << "progress_id=" << forecast.progress_id << " pages_left=" << Opt(forecast.pages_left)
              << " average=" << Opt(forecast.average_pages_per_day) << " reading_days=" << forecast.reading_days
              << " days_remaining=" << Opt(forecast.days_remaining) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const int rc = Run(Parse(argc, argv));
    pagewise::observability::ShutdownLogging();
    return rc;
  } catch (const pagewise::util::EngineError& e) {
    std::cerr << "error=" << pagewise::util::ToString(e.reason()) << " message=" << e.what() << "\n";
    pagewise::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    pagewise::observability::ShutdownLogging();
    return 1;
  }
}
