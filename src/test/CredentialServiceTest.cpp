#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "application/CredentialService.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/Sha256.hpp"
#include "support/FakeSecretStore.hpp"
#include "support/TestProject.hpp"

using namespace shipwright::domain;
using shipwright::application::CredentialService;
using shipwright::infrastructure::Sha256;
using shipwright::test::FakeSecretStore;
using shipwright::test::TestProject;

namespace {

void TestSha256() {
    assert(Sha256::HexDigest("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(Sha256::HexDigest("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::cout << "[PASS] sha256 digests" << std::endl;
}

void TestKeyDerivation() {
    std::filesystem::path root("/home/writer/blog");
    std::string key = CredentialService::CredentialKey(root, CredentialTarget::Ftp, std::string("prod"),
                                                       CredentialKind::Password);
    assert(key == "ftp:password:prod:" + Sha256::HexDigest("/home/writer/blog"));
    assert(key == CredentialService::CredentialKey(root, CredentialTarget::Ftp, std::string("prod"),
                                                   CredentialKind::Password) && "derivation is pure");

    std::string fallback = CredentialService::CredentialKey(root, CredentialTarget::Netlify, std::nullopt,
                                                            CredentialKind::Token);
    assert(fallback.rfind("netlify:token:default:", 0) == 0);

    std::set<std::string> keys{
        key,
        fallback,
        CredentialService::CredentialKey(root, CredentialTarget::Ftp, std::string("staging"), CredentialKind::Password),
        CredentialService::CredentialKey(root, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Token),
        CredentialService::CredentialKey("/home/writer/other", CredentialTarget::Ftp, std::string("prod"),
                                         CredentialKind::Password),
    };
    assert(keys.size() == 5 && "every component participates in the key");
    std::cout << "[PASS] credential key derivation" << std::endl;
}

void TestRoundTrip() {
    TestProject project("credentials");
    project.writeConfig("version = 1\n");
    std::string doc = project.write("posts/today.md", "# today\n").string();

    auto store = std::make_shared<FakeSecretStore>();
    CredentialService service(store);

    assert(!service.get(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password));

    service.set(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password, "  s3cret \n");
    auto value = service.get(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password);
    assert(value && *value == "s3cret" && "value is trimmed before storage");

    auto keys = store->keys(CredentialService::kServiceName);
    assert(keys.size() == 1);
    assert(keys[0] == CredentialService::CredentialKey(project.root(), CredentialTarget::Ftp, std::string("prod"),
                                                       CredentialKind::Password));

    // Other documents of the same project share the entry.
    std::string sibling = project.write("drafts/idea.md", "x").string();
    assert(service.get(sibling, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password) == value);
    assert(!service.get(sibling, CredentialTarget::Ftp, std::nullopt, CredentialKind::Password));

    service.remove(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password);
    assert(!service.get(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password));
    service.remove(doc, CredentialTarget::Ftp, std::string("prod"), CredentialKind::Password);
    assert(store->size() == 0);
    std::cout << "[PASS] set/get/delete round trip" << std::endl;
}

void TestRejections() {
    TestProject project("credentials_reject");
    project.writeConfig("version = 1\n");
    std::string doc = project.write("a.md", "a").string();

    auto store = std::make_shared<FakeSecretStore>();
    CredentialService service(store);

    bool threw = false;
    try {
        service.set(doc, CredentialTarget::Netlify, std::nullopt, CredentialKind::Token, " \t\n");
    } catch (const CredentialError& e) {
        threw = std::string(e.what()) == "Credential value is empty";
    }
    assert(threw && "blank value rejected");
    assert(store->size() == 0);

    store->setBroken(true);
    threw = false;
    try {
        service.get(doc, CredentialTarget::Netlify, std::nullopt, CredentialKind::Token);
    } catch (const CredentialError&) {
        threw = true;
    }
    assert(threw && "store failure surfaces as CredentialError");
    store->setBroken(false);

    TestProject orphan("credentials_orphan");
    std::string lonely = orphan.write("lonely.md", "x").string();
    if (shipwright::infrastructure::PathUtils::FindProjectRoot(lonely)) {
        std::cout << "[SKIP] missing project: temp directory has an ancestor .export.toml" << std::endl;
    } else {
        threw = false;
        try {
            service.set(lonely, CredentialTarget::Ftp, std::nullopt, CredentialKind::Password, "pw");
        } catch (const CredentialError&) {
            threw = true;
        }
        assert(threw && "documents outside a project cannot hold credentials");
    }
    std::cout << "[PASS] rejected inputs" << std::endl;
}

void TestMovedProjectLosesCredentials() {
    TestProject first("credentials_move");
    first.writeConfig("version = 1\n");
    std::string doc = first.write("doc.md", "x").string();

    auto store = std::make_shared<FakeSecretStore>();
    CredentialService service(store);
    service.set(doc, CredentialTarget::Vercel, std::nullopt, CredentialKind::Token, "tok");

    TestProject second("credentials_move_dest");
    second.writeConfig("version = 1\n");
    std::string moved = second.write("doc.md", "x").string();
    assert(!service.get(moved, CredentialTarget::Vercel, std::nullopt, CredentialKind::Token));
    std::cout << "[PASS] relocated project gets fresh keys" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CredentialService Test..." << std::endl;
    TestSha256();
    TestKeyDerivation();
    TestRoundTrip();
    TestRejections();
    TestMovedProjectLosesCredentials();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
