#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "application/DecodeService.hpp"
#include "infrastructure/MemoryHistoryRepository.hpp"

using namespace decodedesk::domain;
using namespace decodedesk::application;
using decodedesk::infrastructure::MemoryHistoryRepository;

namespace {

void expectRejected(const DecodeReport& report, ErrorKind kind) {
    assert(!report.outcome.ok());
    assert(report.outcome.failure().kind == kind);
    assert(report.sessionId.empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting DecodeService Test..." << std::endl;

    auto history = std::make_shared<MemoryHistoryRepository>();
    DecodeServiceLimits limits;
    limits.maxUploadBytes = 64;
    limits.defaultHistoryLimit = 2;
    DecodeService service(history, limits);

    // Validation happens before the engine and records nothing.
    expectRejected(service.decodeText("", "auto", std::nullopt), ErrorKind::Validation);
    expectRejected(service.decodeText("abc", "morse", std::nullopt), ErrorKind::Validation);
    expectRejected(service.decodeText("abc", "", std::nullopt), ErrorKind::Validation);
    expectRejected(service.decodeText("ab\xFF", "caesar", std::nullopt), ErrorKind::Validation);
    assert(history->size() == 0);

    // Decode failures are reported, never turned into a partial success.
    auto oddHex = service.decodeText("48656c6c6", "hex", std::nullopt);
    expectRejected(oddHex, ErrorKind::Decode);
    assert(oddHex.outcome.failure().encoding == EncodingKind::Hex);
    assert(history->size() == 0);

    // Auto detection, lengths in code points, history entry created.
    auto hello = service.decodeText("SGVsbG8=", "auto", std::nullopt);
    assert(hello.outcome.ok());
    assert(hello.outcome.success().decodedText == "Hello");
    assert(hello.outcome.success().resolvedKind == EncodingKind::Base64);
    assert(hello.originalLength == 8);
    assert(hello.decodedLength == 5);
    assert(hello.sessionId.size() == 36);
    assert(hello.sessionId[14] == '4');
    assert(history->size() == 1);

    // Multi-byte output is counted in code points, not bytes.
    auto arabic = service.decodeText("%D9%85%D8%B1", "url", std::nullopt);
    assert(arabic.outcome.ok());
    assert(arabic.originalLength == 12);
    assert(arabic.decodedLength == 2);

    // Shift is honoured for Caesar and ignored elsewhere.
    auto caesar = service.decodeText("Mjqqt", "caesar", 5);
    assert(caesar.outcome.ok() && caesar.outcome.success().decodedText == "Hello");
    auto rot = service.decodeText("Uryyb", "rot13", 5);
    assert(rot.outcome.ok() && rot.outcome.success().decodedText == "Hello");

    // History: newest first, default limit applies.
    auto recent = service.recentHistory();
    assert(recent.size() == 2);
    assert(recent[0].id == rot.sessionId);
    assert(recent[1].id == caesar.sessionId);
    assert(service.recentHistory(10).size() == 4);
    assert(recent[0].resolvedKind == EncodingKind::Rot13);
    assert(recent[0].originalText == "Uryyb");
    assert(recent[0].decodedText == "Hello");

    // File rules
    expectRejected(service.decodeFile({"notes.exe", "48656c6c6f"}, "auto", std::nullopt), ErrorKind::FileRejected);
    expectRejected(service.decodeFile({"README", "48656c6c6f"}, "auto", std::nullopt), ErrorKind::FileRejected);
    expectRejected(service.decodeFile({"big.txt", std::string(65, 'a')}, "auto", std::nullopt), ErrorKind::FileRejected);
    expectRejected(service.decodeFile({"empty.log", ""}, "auto", std::nullopt), ErrorKind::Validation);

    auto fromFile = service.decodeFile({"Message.TXT", "48 65 6c 6c 6f\n"}, "auto", std::nullopt);
    assert(fromFile.outcome.ok());
    assert(fromFile.outcome.success().decodedText == "Hello");
    assert(fromFile.outcome.success().resolvedKind == EncodingKind::Hex);

    // Invalid bytes in a file are replaced, then the text is decoded as usual.
    auto lossy = service.decodeFile({"data.dat", "Khoor\xFF"}, "caesar", std::nullopt);
    assert(lossy.outcome.ok());
    assert(lossy.outcome.success().decodedText == "Hello\xEF\xBF\xBD");
    assert(lossy.originalLength == 6);

    // Integer literal parsing used by the boundary
    assert(DecodeService::ParseIntegerLiteral("13") == 13);
    assert(DecodeService::ParseIntegerLiteral("-4") == -4);
    assert(DecodeService::ParseIntegerLiteral("+7") == 7);
    assert(!DecodeService::ParseIntegerLiteral("3.5"));
    assert(!DecodeService::ParseIntegerLiteral("abc"));
    assert(!DecodeService::ParseIntegerLiteral("-"));
    assert(!DecodeService::ParseIntegerLiteral("99999999999"));

    std::cout << "[PASS] DecodeService Test." << std::endl;
    return 0;
}
