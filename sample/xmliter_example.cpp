/// \file xmliter_example.cpp
/// \brief Walks an XML file with the xmliter streaming API.
///
/// Usage: xmliter_example [--config xmliter.toml] [--events N] <file.xml>
///
/// Prints the parent/child edge counts, the per-path element counts, the
/// first N events of the stream (all of them if N is 0) and the document
/// converted to xmltodict-shaped JSON. Reader limits and logging come from
/// the optional TOML configuration file.

#include "xmliter/xmliter.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace
{
void usage(const char *prog)
{
  std::cerr << "Usage: " << prog << " [--config file.toml] [--events N] <file.xml>" << std::endl;
}

void report(const std::optional<xmliter::Error> &error)
{
  if (error)
  {
    std::cout << "  ! " << xmliter::describe(*error) << std::endl;
  }
}
} // namespace

int main(int argc, char **argv)
{
  std::string configFile;
  std::string xmlFile;
  std::uint64_t maxEvents = 0;

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
    {
      configFile = argv[++i];
    }
    else if (arg == "--events" && i + 1 < argc)
    {
      maxEvents = std::strtoull(argv[++i], nullptr, 10);
    }
    else if (arg == "-h" || arg == "--help")
    {
      usage(argv[0]);
      return EXIT_SUCCESS;
    }
    else if (xmlFile.empty())
    {
      xmlFile = arg;
    }
    else
    {
      usage(argv[0]);
      return EXIT_FAILURE;
    }
  }
  if (xmlFile.empty())
  {
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  xmliter::Config config;
  if (!configFile.empty())
  {
    try
    {
      config = xmliter::Config::fromFile(configFile);
    }
    catch (const std::exception &e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  }
  config.applyLogging();
  xmliter::ReaderOptions readerOpt = config.readerOptions();

  try
  {
    std::cout << "\nedge counts:" << std::endl;
    auto edges = xmliter::countEdges(xmlFile, readerOpt);
    for (const auto &kv : edges.counts)
    {
      std::cout << "  (" << kv.first.first << ", " << kv.first.second << "): " << kv.second
                << std::endl;
    }
    report(edges.error);

    std::cout << "\npath counts:" << std::endl;
    auto paths = xmliter::countPaths(xmlFile, readerOpt);
    for (const auto &kv : paths.counts)
    {
      std::cout << "  " << xmliter::joinPath(kv.first) << ": " << kv.second << std::endl;
    }
    report(paths.error);

    std::cout << "\nevents:" << std::endl;
    xmliter::EventStream stream(xmlFile, readerOpt);
    auto summary = xmliter::forEachEvent(stream,
                                         [maxEvents](const xmliter::Event &ev)
                                         {
                                           std::cout << "  " << ev << std::endl;
                                           return maxEvents == 0 || ev.index + 1 < maxEvents;
                                         });
    report(summary.error);

    std::cout << "\njson:" << std::endl;
    auto converted = xmliter::toMapping(xmlFile, readerOpt, config.reduceOptions());
    std::cout << xmliter::toJson(converted.root).dump(2) << std::endl;
    report(converted.error);
    if (converted.truncated)
    {
      std::cout << "  (truncated after " << converted.eventsConsumed << " events)" << std::endl;
    }
    return converted.error ? EXIT_FAILURE : EXIT_SUCCESS;
  }
  catch (const xmliter::IoError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
