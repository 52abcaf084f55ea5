#include <iostream>
#include <cassert>
#include <nlohmann/json.hpp>
#include "infrastructure/QuarantineStore.hpp"
#include "infrastructure/FileSystemArtifactStore.hpp"
#include "infrastructure/Digest.hpp"
#include "TestSupport.hpp"

using namespace filegate;
using infrastructure::Digest;
using infrastructure::QuarantineStore;
using infrastructure::FileSystemArtifactStore;

int main() {
    std::cout << "[Test] Starting QuarantineStore Test..." << std::endl;
    test::TempDir dir("quarantine");

    // Known digests.
    assert(Digest::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(Digest::HmacSha256Hex("Jefe", "what do ya want for nothing?") ==
           "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    test::WriteFile(dir / "abc.txt", "abc");
    assert(Digest::Sha256FileHex((dir / "abc.txt").string()) == Digest::Sha256Hex("abc"));
    assert(!Digest::Sha256FileHex((dir / "nope.txt").string()));
    test::Pass("sha-256 and hmac vectors");

    // The candidate moves into the store under an opaque key with a sidecar.
    {
        auto upload = dir / "inbox" / "report.docm";
        fs::create_directories(upload.parent_path());
        test::WriteFile(upload, "payload");
        auto candidate = domain::CandidateFile::FromPath(upload.string());

        QuarantineStore store((dir / "q").string());
        auto handle = store.quarantine(candidate, domain::ReasonCode::DisarmFailed, "VBA in legacy container");
        assert(handle);
        assert(handle->id == QuarantineStore::KeyFor(upload.string()));
        assert(handle->id.size() == 64);
        assert(handle->location.find("report") == std::string::npos);
        assert(!fs::exists(upload));
        assert(test::ReadFile(handle->location) == "payload");

        auto perms = fs::status(handle->location).permissions();
        assert((perms & fs::perms::others_read) == fs::perms::none);
        assert((perms & fs::perms::owner_exec) == fs::perms::none);

        auto sidecar = nlohmann::json::parse(test::ReadFile(dir / "q" / (handle->id + ".json")));
        assert(sidecar["reason"] == "DisarmFailed");
        assert(sidecar["original_path"] == upload.string());
        assert(sidecar["claimed_name"] == "report.docm");
        assert(!sidecar["quarantined_at"].get<std::string>().empty());
        test::Pass("candidate quarantined");

        // Nothing left to move.
        assert(!store.quarantine(candidate, domain::ReasonCode::DisarmFailed, "again"));
        test::Pass("missing candidate is not quarantined");

        // A new upload under the same name keeps the earlier copy and its record.
        test::WriteFile(upload, "second payload");
        auto second = store.quarantine(candidate, domain::ReasonCode::MalwareDetected, "second upload");
        assert(second);
        assert(second->id == handle->id + "-1");
        assert(second->location != handle->location);
        assert(test::ReadFile(handle->location) == "payload");
        assert(test::ReadFile(second->location) == "second payload");
        auto first = nlohmann::json::parse(test::ReadFile(dir / "q" / (handle->id + ".json")));
        assert(first["reason"] == "DisarmFailed");
        auto latest = nlohmann::json::parse(test::ReadFile(dir / "q" / (second->id + ".json")));
        assert(latest["reason"] == "MalwareDetected");
        assert(latest["id"] == second->id);

        test::WriteFile(upload, "third payload");
        auto third = store.quarantine(candidate, domain::ReasonCode::DisarmFailed, "third upload");
        assert(third && third->id == handle->id + "-2");
        assert(test::CountFiles(dir / "q") == 6);
        test::Pass("repeated path keeps earlier copies");
    }

    // Admitted artifacts are stored by content hash; anything else is refused.
    {
        auto artifact = dir / "disarmed-1.pdf";
        test::WriteFile(artifact, test::PlainPdf());
        domain::Verdict admitted;
        admitted.decision = domain::Decision::Admitted;
        admitted.reason = domain::ReasonCode::Admitted;
        admitted.candidateName = "Form.PDF";

        FileSystemArtifactStore store((dir / "storage").string());
        auto ref = store.store(artifact.string(), admitted);
        assert(ref);
        std::string hash = Digest::Sha256Hex(test::PlainPdf());
        assert(fs::path(*ref).filename().string() == hash + ".PDF");
        assert(!fs::exists(artifact));
        assert(test::ReadFile(*ref) == test::PlainPdf());
        auto sidecar = nlohmann::json::parse(test::ReadFile(dir / "storage" / (hash + ".verdict.json")));
        assert(sidecar["decision"] == "admitted");
        assert(sidecar["sha256"] == hash);

        auto other = dir / "blocked.txt";
        test::WriteFile(other, "x");
        domain::Verdict blocked;
        blocked.decision = domain::Decision::Blocked;
        blocked.reason = domain::ReasonCode::MalwareDetected;
        assert(!store.store(other.string(), blocked));
        assert(fs::exists(other));
        test::Pass("artifact store");
    }

    std::cout << "[Test] QuarantineStore Test PASSED." << std::endl;
    return 0;
}
