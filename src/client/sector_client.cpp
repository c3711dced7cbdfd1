
#include "sector_client.hpp"

namespace salvage {

const char *sector_status_name(SectorStatus s) {
  switch (s) {
  case SectorStatus::Ok:
    return "ok";
  case SectorStatus::NotFound:
    return "not found";
  case SectorStatus::ContractMissing:
    return "contract missing";
  default:
    return "transport error";
  }
}

SectorStatus classify(const RpcStatus &st) {
  switch (st.kind) {
  case RpcStatus::Kind::Ok:
    return SectorStatus::Ok;
  case RpcStatus::Kind::HostError:
    if (st.message.find(kErrSectorNotFound) != std::string::npos)
      return SectorStatus::NotFound;
    if (st.message.find(kErrNoContract) != std::string::npos)
      return SectorStatus::ContractMissing;
    return SectorStatus::TransportError;
  default:
    return SectorStatus::TransportError;
  }
}

namespace {

SectorResult fail(const RpcStatus &st, const char *stage) {
  SectorResult r;
  r.status = classify(st);
  r.detail = std::string(stage) + ": " + st.message;
  return r;
}

SectorResult fetch_section(HostSession &session, const ReadSection &section,
                           const CancelToken &cancel) {
  HostSettings settings;
  RpcStatus st = session.rpc_settings(settings, cancel);
  if (!st.ok())
    return fail(st, "settings");

  SectorResult r;
  st = session.rpc_read(section, read_cost(settings, section), r.data, cancel);
  if (!st.ok())
    return fail(st, "read");
  if (r.data.size() != section.length) {
    r.status = SectorStatus::TransportError;
    r.detail = "unexpected sector size: " + std::to_string(r.data.size());
    r.data.clear();
    return r;
  }
  r.status = SectorStatus::Ok;
  return r;
}

} // namespace

SectorResult read_sector(HostSession &session, const Hash256 &root,
                         const CancelToken &cancel) {
  ReadSection section;
  section.merkle_root = root;
  SectorResult r = fetch_section(session, section, cancel);
  if (!r.ok())
    return r;
  if (sector_root(r.data) != root) {
    r.status = SectorStatus::TransportError;
    r.detail = "corrupt sector: merkle root mismatch";
    r.data.clear();
  }
  return r;
}

SectorResult check_sector(HostSession &session, const Hash256 &root,
                          const CancelToken &cancel, bool full_verify) {
  if (full_verify)
    return read_sector(session, root, cancel);
  ReadSection section;
  section.merkle_root = root;
  section.length = kSegmentSize;
  return fetch_section(session, section, cancel);
}

} // namespace salvage
