// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/scan_pipeline.hpp"

#include "scan/result_aggregator.hpp"
#include "util/logging.hpp"

#include <thread>

namespace proxyscan {
namespace scan {

ScanPipeline::ScanPipeline(AddressSource& source, verify::ProxyVerifier& verifier, asio::io_context& io_context,
                           size_t queue_capacity, PipelineObserver* observer)
    : source_(source),
      verifier_(verifier),
      io_context_(io_context),
      queue_capacity_(queue_capacity),
      observer_(observer) {}

ScanReport ScanPipeline::Run() {
  io_context_.restart();

  CandidateChannel channel(io_context_, queue_capacity_);
  ResultAggregator aggregator(io_context_, channel, verifier_, observer_);

  std::optional<std::string> source_error;  // written by the producer, read after join
  std::thread producer([this, &channel, &source_error]() {
    try {
      source_.Produce(channel);
    } catch (const SourceError& e) {
      LOG_SCAN_ERROR("address source failed: {}", e.what());
      source_error = e.what();
    } catch (const std::exception& e) {
      LOG_SCAN_ERROR("address source failed unexpectedly: {}", e.what());
      source_error = e.what();
    }
    channel.Close();
  });

  aggregator.Start();
  try {
    io_context_.run();
  } catch (...) {
    // Unblock the producer before unwinding past the channel it uses
    channel.Close();
    producer.join();
    throw;
  }
  producer.join();

  ScanReport report;
  report.results = aggregator.TakeResults();
  report.stats = aggregator.stats();
  report.source_error = std::move(source_error);
  return report;
}

}  // namespace scan
}  // namespace proxyscan
