#include "internal/registry/record_normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using modsync::model::ModKind;
using modsync::model::ToggleState;
using modsync::testing::MakeMod;
using modsync::testing::MakeSkin;

void TestArchiveModIsKeyedByDirectoryName() {
  auto entry = MakeMod("FreeCam", true, "/game/reframework/FreeCam/preview.png");
  entry.mutable_fields()->set_author("praydog");

  const auto record = modsync::registry::FromWire(entry);
  assert(record.kind == ModKind::kArchive);
  assert(record.key == "FreeCam");
  assert(record.enabled);
  assert(record.author.has_value() && *record.author == "praydog");
  assert(!record.version.has_value());
  assert(record.thumbnail_path == std::optional<std::string>("/game/reframework/FreeCam/preview.png"));
  assert(record.mod_type == modsync::model::ModType::kREFrameworkPlugin);
  assert(record.toggle_state == ToggleState::kSynced);
}

void TestArchiveModWithoutDirectoryNameIsRejected() {
  auto entry = MakeMod("", false);

  bool threw = false;
  try {
    (void)modsync::registry::FromWire(entry);
  } catch (const modsync::util::ContractViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestFlatSkinIsKeyedByPath() {
  auto entry = MakeSkin("C:\\Games\\MHWilds\\skins\\Alma.pak", false);
  entry.set_name("");
  entry.add_conflicts("Other.pak");

  const auto record = modsync::registry::FromWire(entry);
  assert(record.kind == ModKind::kSkin);
  assert(record.key == "C:\\Games\\MHWilds\\skins\\Alma.pak");
  assert(record.directory_name == "Alma.pak");
  assert(record.name == "Alma.pak");
  assert(record.mod_type == modsync::model::ModType::kSkinMod);
  assert(record.conflicts == std::vector<std::string>{"Other.pak"});
}

void TestNestedSkinUsesBaseFields() {
  modsync::v1::SkinModEntry entry;
  auto*                     base = entry.mutable_base();
  base->set_name("Alma Outfit");
  base->set_directory_name("alma");
  base->set_path("/game/skins/alma");
  base->set_enabled(true);
  base->set_version("1.2");

  const auto record = modsync::registry::FromWire(entry);
  assert(record.key == "/game/skins/alma");
  assert(record.name == "Alma Outfit");
  assert(record.enabled);
  assert(record.version == std::optional<std::string>("1.2"));
}

void TestMixedSkinShapeIsRejected() {
  auto entry = MakeSkin("/game/skins/alma", true);
  entry.mutable_base()->set_path("/game/skins/alma");

  bool threw = false;
  try {
    (void)modsync::registry::FromWire(entry);
  } catch (const modsync::util::ContractViolation& e) {
    threw = std::string(e.what()).find("/game/skins/alma") != std::string::npos;
  }
  assert(threw);
}

void TestDuplicateKeysAreReported() {
  std::vector<modsync::v1::ModEntry> entries = {MakeMod("A", true), MakeMod("B", false), MakeMod("A", false)};

  bool threw = false;
  try {
    (void)modsync::registry::NormalizeListing(entries);
  } catch (const modsync::util::DataIntegrityError& e) {
    threw = std::string(e.what()).find("'A'") != std::string::npos;
  }
  assert(threw);
}

void TestListingKeepsRegistryOrder() {
  std::vector<modsync::v1::SkinModEntry> entries = {MakeSkin("/s/b.pak", true), MakeSkin("/s/a.pak", false)};

  const auto records = modsync::registry::NormalizeListing(entries);
  assert(records.size() == 2);
  assert(records[0].key == "/s/b.pak");
  assert(records[1].key == "/s/a.pak");
}

} // namespace

int main() {
  TestArchiveModIsKeyedByDirectoryName();
  TestArchiveModWithoutDirectoryNameIsRejected();
  TestFlatSkinIsKeyedByPath();
  TestNestedSkinUsesBaseFields();
  TestMixedSkinShapeIsRejected();
  TestDuplicateKeysAreReported();
  TestListingKeepsRegistryOrder();

  std::cout << "modsync_unit_record_normalizer: pass\n";
  return 0;
}
