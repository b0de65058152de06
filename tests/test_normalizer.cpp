#include <gtest/gtest.h>

#include "normalizer.hpp"
#include "test_helpers.hpp"

using namespace cutlist;
using namespace cutlist::fixtures;

namespace {

ValidationError expectRejected(const InputSnapshot& snapshot, ErrorKind kind) {
    auto result = normalize(snapshot);
    EXPECT_FALSE(result.ok());
    if (result.ok()) {
        return {};
    }
    EXPECT_EQ(result.error().kind, kind) << result.error().describe();
    return result.error();
}

} // namespace

TEST(Normalizer, AssignsDefaultBoardAndEdging) {
    auto snapshot = standardSnapshot();
    Part part = makePart("side", 720, 560, 2);
    part.edge(Edge::Top).banded = true;
    snapshot.parts.push_back(part);

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    const auto& input = result.value();

    ASSERT_EQ(input.groups.size(), 1u);
    EXPECT_EQ(input.groups[0].board.id, "white");
    const Part& normalized = input.groups[0].parts[0];
    EXPECT_EQ(normalized.material_id, std::optional<std::string>("white"));
    EXPECT_EQ(normalized.edge(Edge::Top).edging_material_id, std::optional<std::string>("abs16"));
    EXPECT_FALSE(normalized.edge(Edge::Left).edging_material_id.has_value());
    EXPECT_TRUE(input.backer_boards.empty());
}

TEST(Normalizer, GroupsFollowBoardCatalogOrder) {
    auto snapshot = standardSnapshot();
    snapshot.primary_boards.push_back(makeBoard("oak", 2440, 1220, false));
    std::swap(snapshot.primary_boards[0], snapshot.primary_boards[1]);

    Part first = makePart("a", 500, 400);
    Part second = makePart("b", 500, 400);
    second.material_id = "oak";
    snapshot.parts = {first, second};

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().groups.size(), 2u);
    EXPECT_EQ(result.value().groups[0].board.id, "oak");
    EXPECT_EQ(result.value().groups[1].board.id, "white");
}

TEST(Normalizer, RejectsNonPositiveDimensions) {
    auto snapshot = standardSnapshot();
    snapshot.parts.push_back(makePart("flat", 0, 400));
    auto error = expectRejected(snapshot, ErrorKind::InvalidDimension);
    EXPECT_EQ(error.part_id, "flat");

    snapshot.parts[0] = makePart("thin", 500, 400);
    snapshot.parts[0].thickness_mm = -1;
    expectRejected(snapshot, ErrorKind::InvalidDimension);
}

TEST(Normalizer, RejectsNonPositiveQuantity) {
    auto snapshot = standardSnapshot();
    snapshot.parts.push_back(makePart("none", 500, 400, 0));
    auto error = expectRejected(snapshot, ErrorKind::InvalidQuantity);
    EXPECT_EQ(error.part_id, "none");
}

TEST(Normalizer, RejectsBadBoards) {
    auto snapshot = standardSnapshot();
    snapshot.parts.push_back(makePart("a", 500, 400));
    snapshot.primary_boards[0].sheet_width_mm = 0;
    auto error = expectRejected(snapshot, ErrorKind::InvalidDimension);
    EXPECT_EQ(error.material_id, "white");

    snapshot = standardSnapshot();
    snapshot.parts.push_back(makePart("a", 500, 400));
    snapshot.primary_boards[0].cost_per_sheet = -10;
    expectRejected(snapshot, ErrorKind::InvalidDimension);
}

TEST(Normalizer, RejectsNegativeKerf) {
    auto snapshot = standardSnapshot();
    snapshot.kerf_mm = -0.5;
    expectRejected(snapshot, ErrorKind::InvalidDimension);
}

TEST(Normalizer, KerfMustBeSmallerThanEverySide) {
    auto snapshot = standardSnapshot();
    snapshot.parts = {makePart("big", 800, 600), makePart("slim", 500, 3)};
    auto error = expectRejected(snapshot, ErrorKind::KerfTooLarge);
    EXPECT_EQ(error.part_id, "slim");

    snapshot.parts[1].width_mm = 3.5;
    EXPECT_TRUE(normalize(snapshot).ok());
}

TEST(Normalizer, MissingDefaultBoard) {
    auto snapshot = standardSnapshot();
    snapshot.primary_boards[0].is_default = false;
    snapshot.parts.push_back(makePart("a", 500, 400));
    auto error = expectRejected(snapshot, ErrorKind::NoDefaultMaterial);
    EXPECT_EQ(error.part_id, "a");

    snapshot.parts[0].material_id = "white";
    EXPECT_TRUE(normalize(snapshot).ok());
}

TEST(Normalizer, UnknownBoardReference) {
    auto snapshot = standardSnapshot();
    Part part = makePart("a", 500, 400);
    part.material_id = "walnut";
    snapshot.parts.push_back(part);
    auto error = expectRejected(snapshot, ErrorKind::UnknownMaterial);
    EXPECT_EQ(error.material_id, "walnut");
}

TEST(Normalizer, BandedEdgeNeedsEdgingForThickness) {
    auto snapshot = standardSnapshot();
    Part part = makePart("top", 1200, 600);
    part.thickness_mm = 32;
    part.edge(Edge::Left).banded = true;
    snapshot.parts.push_back(part);
    expectRejected(snapshot, ErrorKind::NoDefaultMaterial);

    snapshot.edging.push_back(makeEdging("abs32", 32, true));
    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().groups[0].parts[0].edge(Edge::Left).edging_material_id,
              std::optional<std::string>("abs32"));
}

TEST(Normalizer, UnbandedPartNeedsNoEdging) {
    auto snapshot = standardSnapshot();
    snapshot.edging.clear();
    snapshot.parts.push_back(makePart("a", 500, 400));
    EXPECT_TRUE(normalize(snapshot).ok());
}

TEST(Normalizer, ExplicitEdgingMustExist) {
    auto snapshot = standardSnapshot();
    Part part = makePart("a", 500, 400);
    part.edge(Edge::Bottom).banded = true;
    part.edge(Edge::Bottom).edging_material_id = "pvc-red";
    snapshot.parts.push_back(part);
    auto error = expectRejected(snapshot, ErrorKind::UnknownMaterial);
    EXPECT_EQ(error.material_id, "pvc-red");
}

TEST(Normalizer, TwoDefaultsAreAmbiguous) {
    auto snapshot = standardSnapshot();
    snapshot.primary_boards.push_back(makeBoard("oak", 2440, 1220, true));
    snapshot.parts.push_back(makePart("a", 500, 400));
    expectRejected(snapshot, ErrorKind::AmbiguousDefault);

    snapshot = standardSnapshot();
    snapshot.edging.push_back(makeEdging("pvc16", 16, true));
    snapshot.parts.push_back(makePart("a", 500, 400));
    expectRejected(snapshot, ErrorKind::AmbiguousDefault);
}

TEST(Normalizer, LaminationNeedsBackerBoard) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    snapshot.parts.push_back(makePart("desk", 1400, 700));
    expectRejected(snapshot, ErrorKind::NoBackerMaterial);

    snapshot.backer_boards.push_back(makeBoard("hdf", 2440, 1220, false));
    snapshot.backer_material_id = "hdf";
    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().backer_boards.size(), 1u);
    EXPECT_EQ(result.value().backer_boards[0].id, "hdf");

    snapshot.backer_material_id = "mdf";
    expectRejected(snapshot, ErrorKind::UnknownMaterial);
}

TEST(Normalizer, DefaultBackerUsedWithoutExplicitChoice) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    snapshot.backer_boards.push_back(makeBoard("hdf", 2440, 1220, true));
    snapshot.parts.push_back(makePart("desk", 1400, 700));

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().backer_boards.size(), 1u);
    EXPECT_EQ(result.value().backer_boards[0].id, "hdf");
    const Part& desk = result.value().groups[0].parts[0];
    EXPECT_EQ(desk.lamination, std::optional<LaminationType>(LaminationType::WithBacker));
    EXPECT_EQ(desk.backer_material_id, std::optional<std::string>("hdf"));
}

TEST(Normalizer, NoBackerNeededWhenEveryPartOptsOut) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    Part part = makePart("shelf", 600, 300);
    part.lamination = LaminationType::None;
    snapshot.parts.push_back(part);

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().backer_boards.empty());
    EXPECT_EQ(result.value().groups[0].parts[0].lamination,
              std::optional<LaminationType>(LaminationType::None));
}

TEST(Normalizer, LaminateFlagIgnoredWhenLaminationOff) {
    auto snapshot = standardSnapshot();
    Part part = makePart("shelf", 600, 300);
    part.lamination = LaminationType::WithBacker;
    part.backer_material_id = "hdf";
    snapshot.parts.push_back(part);

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok());
    const Part& shelf = result.value().groups[0].parts[0];
    EXPECT_EQ(shelf.lamination, std::optional<LaminationType>(LaminationType::None));
    EXPECT_FALSE(shelf.backer_material_id.has_value());
}

TEST(Normalizer, SameBoardLaminationNeedsNoBacker) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    Part part = makePart("worktop", 1800, 600);
    part.lamination = LaminationType::SameBoard;
    snapshot.parts.push_back(part);

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result.value().backer_boards.empty());
    EXPECT_EQ(result.value().groups[0].parts[0].quantity, 1);
}

TEST(Normalizer, PartBackerOverridesSnapshotBacker) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    snapshot.backer_boards.push_back(makeBoard("hdf", 2440, 1220, true));
    snapshot.backer_boards.push_back(makeBoard("mdf", 2440, 1220, false));
    Part desk = makePart("desk", 1400, 700);
    Part door = makePart("door", 700, 450);
    door.backer_material_id = "mdf";
    snapshot.parts = {desk, door};

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    const auto& backers = result.value().backer_boards;
    ASSERT_EQ(backers.size(), 2u);
    EXPECT_EQ(backers[0].id, "hdf");
    EXPECT_EQ(backers[1].id, "mdf");
    const auto& parts = result.value().groups[0].parts;
    EXPECT_EQ(parts[0].backer_material_id, std::optional<std::string>("hdf"));
    EXPECT_EQ(parts[1].backer_material_id, std::optional<std::string>("mdf"));

    snapshot.parts[1].backer_material_id = "birch";
    auto error = expectRejected(snapshot, ErrorKind::UnknownMaterial);
    EXPECT_EQ(error.part_id, "door");
    EXPECT_EQ(error.material_id, "birch");
}

TEST(Normalizer, LaminatedPartsTakeEdgingForDoubleThickness) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    snapshot.backer_boards.push_back(makeBoard("hdf", 2440, 1220, true));
    Part worktop = makePart("worktop", 1800, 600);
    worktop.lamination = LaminationType::SameBoard;
    worktop.edge(Edge::Bottom).banded = true;
    snapshot.parts.push_back(worktop);

    auto error = expectRejected(snapshot, ErrorKind::NoDefaultMaterial);
    EXPECT_EQ(error.part_id, "worktop");
    EXPECT_NE(error.message.find("bottom"), std::string::npos) << error.message;
    EXPECT_NE(error.message.find("32mm"), std::string::npos) << error.message;

    snapshot.edging.push_back(makeEdging("abs32", 32, true));
    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(result.value().groups[0].parts[0].edge(Edge::Bottom).edging_material_id,
              std::optional<std::string>("abs32"));
}

TEST(Normalizer, LaminationWithoutLaminatedPartsNeedsNoBacker) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    Part shelf = makePart("shelf", 600, 300);
    shelf.lamination = LaminationType::None;
    Part plinth = makePart("plinth", 1000, 150);
    plinth.lamination = LaminationType::SameBoard;
    snapshot.parts = {shelf, plinth};

    auto result = normalize(snapshot);
    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_TRUE(result.value().backer_boards.empty());
}

TEST(Normalizer, RejectsRepeatedPartIds) {
    auto snapshot = standardSnapshot();
    Part banded = makePart("row", 1000, 500);
    banded.edge(Edge::Top).banded = true;
    Part plain = makePart("row", 300, 200);
    snapshot.parts = {banded, plain};

    auto error = expectRejected(snapshot, ErrorKind::DuplicatePartId);
    EXPECT_EQ(error.part_id, "row");
}
