#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/hash.hpp"
#include "frostcoord/crypto/random.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/net/envelope.hpp"
#include "frostcoord/protocol/session_coordinator.hpp"
#include "frostcoord/protocol/submission_router.hpp"
#include "frostcoord/storage/in_memory_record_store.hpp"

namespace {

using frostcoord::Bytes;
using frostcoord::ECPoint;
using frostcoord::Envelope;
using frostcoord::EnvelopeType;
using frostcoord::Scalar;
using frostcoord::SessionId;
using frostcoord::SessionState;
using frostcoord::ShareIndex;

struct BenchArgs {
  uint32_t n = 5;
  uint32_t k = 3;
  uint32_t sessions = 50;
  uint32_t verify_threads = 0;
};

struct PhaseMetric {
  double total_ms = 0.0;
  uint64_t total_bytes = 0;
  uint64_t samples = 0;
};

struct SessionMetrics {
  PhaseMetric create;
  PhaseMetric commit;
  PhaseMetric sign;
  PhaseMetric finalize;
};

struct Signer {
  std::string id;
  Scalar share;
  Scalar nonce;
};

class NullPublisher : public frostcoord::IEventPublishingGateway {
 public:
  std::string Publish(const frostcoord::SchnorrSignature&,
                      const Bytes&,
                      const std::string&) override {
    return "bench-" + std::to_string(++published_);
  }

 private:
  uint64_t published_ = 0;
};

class NoApprovalTransport : public frostcoord::IHardwareApprovalTransport {
 public:
  frostcoord::ApprovalResponse RequestApproval(const frostcoord::ApprovalRequest&) override {
    throw frostcoord::SigningError(frostcoord::ErrorCode::kTransportUnavailable,
                                   "benchmark runs without approval tokens");
  }
};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

uint32_t ParsePositiveU32(const char* value, const char* flag) {
  try {
    const unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--n" && i + 1 < argc) {
      args.n = ParsePositiveU32(argv[++i], "--n");
    } else if (flag == "--k" && i + 1 < argc) {
      args.k = ParsePositiveU32(argv[++i], "--k");
    } else if (flag == "--sessions" && i + 1 < argc) {
      args.sessions = ParsePositiveU32(argv[++i], "--sessions");
    } else if (flag == "--verify-threads" && i + 1 < argc) {
      args.verify_threads = ParsePositiveU32(argv[++i], "--verify-threads");
    } else if (flag == "--help") {
      std::cout << "Usage: coordinator_bench [--n N] [--k K] [--sessions S] [--verify-threads T]\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }

  if (args.n < 2) {
    throw std::invalid_argument("--n must be >= 2");
  }
  if (args.k < 2 || args.k > args.n) {
    throw std::invalid_argument("--k must be in [2, n]");
  }
  return args;
}

void RecordMetric(PhaseMetric* metric,
                  std::chrono::steady_clock::time_point start,
                  std::chrono::steady_clock::time_point end,
                  uint64_t bytes) {
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  metric->total_bytes += bytes;
  ++metric->samples;
}

Envelope MakeEnvelope(const SessionId& session_id,
                      const std::string& sender,
                      EnvelopeType type,
                      Bytes payload) {
  Envelope envelope;
  envelope.session_id = session_id;
  envelope.sender = sender;
  envelope.type = static_cast<uint32_t>(type);
  envelope.payload = std::move(payload);
  return envelope;
}

uint64_t DeliverOrThrow(frostcoord::SubmissionRouter& router, const Envelope& envelope) {
  const Bytes encoded = frostcoord::EncodeEnvelope(envelope);
  const frostcoord::EnvelopeReply reply =
      frostcoord::DecodeEnvelopeReply(router.RouteEncoded(encoded));
  Expect(reply.ok, "envelope rejected: " + reply.message);
  return encoded.size();
}

void RunSession(frostcoord::SessionCoordinator& coordinator,
                frostcoord::SubmissionRouter& router,
                std::vector<Signer>& signers,
                const BenchArgs& args,
                uint32_t round,
                SessionMetrics* metrics) {
  SessionId session_id;
  {
    const auto start = std::chrono::steady_clock::now();
    frostcoord::SessionRequest request;
    request.group_id = "bench-group";
    const std::string message = "bench message " + std::to_string(round);
    request.message_hash = frostcoord::Sha256(frostcoord::AsByteSpan(message));
    for (const Signer& signer : signers) {
      request.participants.push_back(signer.id);
    }
    request.threshold = args.k;
    request.destination = "bench://sink";
    request.created_by = "bench";
    session_id = coordinator.CreateSession(request).id;
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->create, start, end, 0);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    uint64_t bytes = 0;
    for (uint32_t i = 0; i < args.k; ++i) {
      Signer& signer = signers[(round + i) % signers.size()];
      signer.nonce = frostcoord::Csprng::RandomScalar();
      bytes += DeliverOrThrow(
          router, MakeEnvelope(session_id, signer.id, EnvelopeType::kNonceCommitment,
                               ECPoint::GeneratorMultiply(signer.nonce).ToCompressedBytes()));
    }
    Expect(coordinator.GetSessionStatus(session_id).state == SessionState::kSigning,
           "session did not enter signing");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->commit, start, end, bytes);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    const frostcoord::SigningPackage package = coordinator.GetSigningPackage(session_id);
    uint64_t bytes = 0;
    for (uint32_t i = 0; i < args.k; ++i) {
      const Signer& signer = signers[(round + i) % signers.size()];
      const Scalar z =
          frostcoord::ComputePartialSignature(signer.share, signer.nonce, package.challenge);
      const auto z_bytes = z.ToCanonicalBytes();
      bytes += DeliverOrThrow(router, MakeEnvelope(session_id, signer.id,
                                                   EnvelopeType::kPartialSignature,
                                                   Bytes(z_bytes.begin(), z_bytes.end())));
    }
    Expect(coordinator.GetSessionStatus(session_id).state == SessionState::kAggregating,
           "session did not reach aggregating");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->sign, start, end, bytes);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    const frostcoord::FinalizeResult result = coordinator.Finalize(session_id);
    Expect(result.status == frostcoord::FinalizeStatus::kPublished, "session not published");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->finalize, start, end,
                 frostcoord::EncodeSignature(*result.signature).size());
  }
}

void PrintMetricLine(const std::string& name, const PhaseMetric& metric) {
  const double avg_ms = metric.total_ms / static_cast<double>(metric.samples);
  const double avg_bytes = static_cast<double>(metric.total_bytes) / static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(14) << name << "  "
            << std::right << std::setw(12) << std::fixed << std::setprecision(3) << avg_ms << "  "
            << std::setw(14) << std::fixed << std::setprecision(1) << avg_bytes << '\n';
}

void PrintSummary(const SessionMetrics& metrics) {
  std::cout << "\n[Session]\n";
  std::cout << std::left << std::setw(14) << "Phase"
            << "  " << std::right << std::setw(12) << "Avg ms"
            << "  " << std::setw(14) << "Avg bytes\n";
  PrintMetricLine("create", metrics.create);
  PrintMetricLine("commit", metrics.commit);
  PrintMetricLine("sign", metrics.sign);
  PrintMetricLine("finalize", metrics.finalize);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const BenchArgs args = ParseArgs(argc, argv);
    std::cout << "Coordinator benchmark config: n=" << args.n
              << ", k=" << args.k
              << ", sessions=" << args.sessions
              << ", verify_threads=" << args.verify_threads << '\n';

    auto identities = std::make_shared<frostcoord::InMemoryIdentityResolver>();
    std::vector<ShareIndex> indices;
    for (ShareIndex index = 1; index <= args.n; ++index) {
      indices.push_back(index);
    }
    const Scalar secret = frostcoord::Csprng::RandomScalar();
    const std::unordered_map<ShareIndex, Scalar> shares =
        frostcoord::DealShares(secret, args.k, indices);
    identities->RegisterGroup("bench-group", ECPoint::GeneratorMultiply(secret));

    std::vector<Signer> signers;
    for (ShareIndex index : indices) {
      Signer signer;
      signer.id = "guardian-" + std::to_string(index);
      signer.share = shares.at(index);
      identities->RegisterParticipant("bench-group", signer.id, index,
                                      ECPoint::GeneratorMultiply(signer.share));
      signers.push_back(signer);
    }
    identities->RegisterMember("bench-group", "bench", frostcoord::MemberRole::kSteward);

    frostcoord::CoordinatorConfig config;
    config.max_threshold = args.n;
    config.verify_threads = args.verify_threads;
    config.log_level = "warn";

    frostcoord::CoordinatorDependencies dependencies;
    dependencies.records = std::make_shared<frostcoord::InMemoryRecordStore>();
    dependencies.identities = identities;
    dependencies.publisher = std::make_shared<NullPublisher>();
    dependencies.approval_transport = std::make_shared<NoApprovalTransport>();
    frostcoord::SessionCoordinator coordinator(dependencies, config);
    frostcoord::SubmissionRouter router(coordinator);

    SessionMetrics metrics;
    for (uint32_t i = 0; i < args.sessions; ++i) {
      RunSession(coordinator, router, signers, args, i, &metrics);
    }
    PrintSummary(metrics);
  } catch (const std::exception& ex) {
    std::cerr << "benchmark failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
