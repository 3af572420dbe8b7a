#include "bv/security/validators.h"

#include "bv/error.h"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

template <class Fn>
std::optional<bv::Error> CaptureError(Fn&& fn) {
  try {
    fn();
  } catch (const bv::Error& err) {
    return err;
  }
  return std::nullopt;
}

void TestBookmarkNames() {
  using bv::security::CheckBookmarkName;
  using bv::security::ValidationResult;

  assert(CheckBookmarkName("my-bookmark") == ValidationResult::kOk);
  assert(CheckBookmarkName("my bookmark") == ValidationResult::kOk);
  assert(CheckBookmarkName("my.bookmark") == ValidationResult::kOk);
  assert(CheckBookmarkName("my/bookmark") == ValidationResult::kOk);
  assert(CheckBookmarkName("logs_2024\tarchive") == ValidationResult::kOk);
  assert(CheckBookmarkName(std::string(255, 'b')) == ValidationResult::kOk);

  assert(CheckBookmarkName("") == ValidationResult::kEmpty);
  assert(CheckBookmarkName(std::string(256, 'b')) == ValidationResult::kTooLong);
  // Length is checked before the character set.
  assert(CheckBookmarkName(std::string(300, '\0')) == ValidationResult::kTooLong);
  assert(CheckBookmarkName("my<>bookmark") == ValidationResult::kInvalidCharacters);
  assert(CheckBookmarkName("my;bookmark") == ValidationResult::kInvalidCharacters);
  assert(CheckBookmarkName("vertical\vtab") == ValidationResult::kInvalidCharacters);
  assert(CheckBookmarkName("caf\xc3\xa9") == ValidationResult::kInvalidCharacters);

  auto empty = CaptureError([] { bv::security::RequireValidBookmarkName(""); });
  assert(empty && empty->domain == bv::ErrorDomain::Validation);
  assert(empty->code == bv::errors::validation::kBookmarkNameEmpty);
  assert(std::string_view(empty->what()) == "bookmark name cannot be empty");

  auto too_long = CaptureError([] { bv::security::RequireValidBookmarkName(std::string(256, 'x')); });
  assert(too_long && too_long->code == bv::errors::validation::kBookmarkNameTooLong);
  assert(std::string_view(too_long->what()) == "bookmark name too long (max 255 characters)");

  auto charset = CaptureError([] { bv::security::RequireValidBookmarkName("a|b"); });
  assert(charset && charset->code == bv::errors::validation::kBookmarkNameCharset);
  assert(std::string_view(charset->what()) == "bookmark name contains invalid characters");

  assert(!CaptureError([] { bv::security::RequireValidBookmarkName("reports/q3 final.v2"); }));
}

void TestProfileNames() {
  using bv::security::CheckProfileName;
  using bv::security::ValidationResult;

  assert(CheckProfileName("my-profile") == ValidationResult::kOk);
  assert(CheckProfileName("my_profile") == ValidationResult::kOk);
  assert(CheckProfileName("profile123") == ValidationResult::kOk);
  assert(CheckProfileName("") == ValidationResult::kOk);
  assert(CheckProfileName(std::string(128, 'p')) == ValidationResult::kOk);

  assert(CheckProfileName(std::string(129, 'p')) == ValidationResult::kTooLong);
  assert(CheckProfileName(std::string(200, '\0')) == ValidationResult::kTooLong);
  assert(CheckProfileName("my profile") == ValidationResult::kInvalidCharacters);
  assert(CheckProfileName("my.profile") == ValidationResult::kInvalidCharacters);
  assert(CheckProfileName("team/dev") == ValidationResult::kInvalidCharacters);

  assert(!CaptureError([] { bv::security::RequireValidProfileName(""); }));
  auto too_long = CaptureError([] { bv::security::RequireValidProfileName(std::string(129, 'p')); });
  assert(too_long && too_long->code == bv::errors::validation::kProfileNameTooLong);
  assert(std::string_view(too_long->what()) == "profile name too long (max 128 characters)");
  auto charset = CaptureError([] { bv::security::RequireValidProfileName("prod.eu"); });
  assert(charset && charset->code == bv::errors::validation::kProfileNameCharset);
  assert(std::string_view(charset->what()) == "profile name contains invalid characters");
}

void TestBucketNames() {
  using bv::security::CheckBucketName;
  using bv::security::ValidationResult;

  assert(CheckBucketName("my-bucket") == ValidationResult::kOk);
  assert(CheckBucketName("my.bucket.name") == ValidationResult::kOk);
  assert(CheckBucketName("bucket123") == ValidationResult::kOk);
  assert(CheckBucketName("abc") == ValidationResult::kOk);
  assert(CheckBucketName(std::string(63, 'b')) == ValidationResult::kOk);
  assert(CheckBucketName("") == ValidationResult::kOk);
  // Simplified grammar: these pass even though the full naming rules refuse them.
  assert(CheckBucketName("a..b") == ValidationResult::kOk);
  assert(CheckBucketName("192.168.1.1") == ValidationResult::kOk);

  assert(CheckBucketName("ab") == ValidationResult::kTooShort);
  assert(CheckBucketName(std::string(64, 'b')) == ValidationResult::kTooLong);
  assert(CheckBucketName(std::string(70, '\0')) == ValidationResult::kTooLong);
  assert(CheckBucketName("My-Bucket") == ValidationResult::kInvalidFormat);
  assert(CheckBucketName("my_bucket") == ValidationResult::kInvalidFormat);
  assert(CheckBucketName("-bucket") == ValidationResult::kInvalidFormat);
  assert(CheckBucketName("bucket.") == ValidationResult::kInvalidFormat);

  auto length = CaptureError([] { bv::security::RequireValidBucketName("ab"); });
  assert(length && length->code == bv::errors::validation::kBucketNameLength);
  assert(std::string_view(length->what()) == "bucket name must be 3-63 characters");
  auto format = CaptureError([] { bv::security::RequireValidBucketName("Bucket"); });
  assert(format && format->code == bv::errors::validation::kBucketNameFormat);
  assert(std::string_view(format->what()) == "invalid bucket name format");
}

void TestBookmarkDraft() {
  bv::security::BookmarkDraft draft{"nightly exports", "", "data-lake", "exports/"};
  assert(!CaptureError([&] { bv::security::RequireValidBookmarkDraft(draft); }));

  // Every field is wrong; the name is reported first.
  bv::security::BookmarkDraft broken{"", "bad profile", "Bad_Bucket", ""};
  auto err = CaptureError([&] { bv::security::RequireValidBookmarkDraft(broken); });
  assert(err && err->code == bv::errors::validation::kBookmarkNameEmpty);

  broken.name = "ok";
  err = CaptureError([&] { bv::security::RequireValidBookmarkDraft(broken); });
  assert(err && err->code == bv::errors::validation::kProfileNameCharset);

  broken.profile = "default";
  err = CaptureError([&] { bv::security::RequireValidBookmarkDraft(broken); });
  assert(err && err->code == bv::errors::validation::kBucketNameFormat);
}

void TestMessages() {
  using bv::security::IdentifierKind;
  using bv::security::ValidationMessage;
  using bv::security::ValidationResult;
  assert(ValidationMessage(IdentifierKind::kBookmarkName, ValidationResult::kOk).empty());
  assert(ValidationMessage(IdentifierKind::kBucketName, ValidationResult::kTooLong) ==
         "bucket name must be 3-63 characters");
  assert(ValidationMessage(IdentifierKind::kProfileName, ValidationResult::kInvalidCharacters) ==
         "profile name contains invalid characters");
}

}  // namespace

int main() {
  TestBookmarkNames();
  TestProfileNames();
  TestBucketNames();
  TestBookmarkDraft();
  TestMessages();
  std::cout << "validator tests ok\n";
  return 0;
}
