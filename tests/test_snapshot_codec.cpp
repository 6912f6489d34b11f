#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "timeline/snapshot_codec.hpp"

namespace {

template <typename Exception, typename Fn>
bool throwsError(Fn fn)
{
    try {
        fn();
    } catch (const Exception &) {
        return true;
    }
    return false;
}

} // namespace

class SnapshotCodecTests : public QObject
{
    Q_OBJECT
private slots:
    void testBookPayload();
    void testBookWithoutAuthorsOrGenres();
    void testNamedPayloads();
    void testReadingPayload();
    void testMissingFieldsRejected();
    void testDeterministic();
    void testRatings();
    void testToEntryToleratesBadJson();
};

void SnapshotCodecTests::testBookPayload()
{
    leafline::BookSnapshot book;
    book.id = 1;
    book.title = "Good Omens";
    book.authors = {"Terry Pratchett", "Neil Gaiman"};
    book.primaryGenre = "Fantasy";
    book.secondaryGenre = "Comedy";
    book.pageCount = 412;

    const auto payload = leafline::buildPayload(book);
    QCOMPARE(QString::fromStdString(payload.title), QStringLiteral("Good Omens"));
    QVERIFY(!payload.readingDataJson.has_value());

    const auto details = leafline::decodeDetails(payload.detailsJson);
    QCOMPARE(details.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(details.at(0).label), QStringLiteral("Author"));
    QCOMPARE(QString::fromStdString(details.at(0).value),
             QStringLiteral("Terry Pratchett, Neil Gaiman"));
    QCOMPARE(QString::fromStdString(details.at(1).label), QStringLiteral("Genres"));
    QCOMPARE(QString::fromStdString(details.at(1).value), QStringLiteral("Fantasy, Comedy"));
    QCOMPARE(QString::fromStdString(details.at(2).value), QStringLiteral("412"));

    const auto genres = leafline::decodeGenres(payload.genresJson);
    QVERIFY(genres.has_value());
    QCOMPARE(genres->size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(genres->at(0)), QStringLiteral("Fantasy"));
}

void SnapshotCodecTests::testBookWithoutAuthorsOrGenres()
{
    leafline::BookSnapshot book;
    book.id = 2;
    book.title = "Anonymous Verses";

    const auto payload = leafline::buildPayload(book);
    const auto details = leafline::decodeDetails(payload.detailsJson);
    QCOMPARE(details.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(details.front().value), QStringLiteral("Unknown"));

    QVERIFY(payload.genresJson.has_value());
    QCOMPARE(QString::fromStdString(*payload.genresJson), QStringLiteral("[]"));
}

void SnapshotCodecTests::testNamedPayloads()
{
    const auto author = leafline::buildPayload(leafline::AuthorSnapshot{3, "Ursula K. Le Guin"});
    QCOMPARE(QString::fromStdString(author.title), QStringLiteral("Ursula K. Le Guin"));
    QCOMPARE(QString::fromStdString(author.detailsJson), QStringLiteral("[]"));
    QVERIFY(!author.genresJson.has_value());

    const auto genre = leafline::buildPayload(leafline::GenreSnapshot{4, "Poetry"});
    QCOMPARE(QString::fromStdString(genre.title), QStringLiteral("Poetry"));

    QCOMPARE(leafline::snapshotType(leafline::AuthorSnapshot{3, "x"}), leafline::EntityType::Author);
    QCOMPARE(leafline::snapshotType(leafline::GenreSnapshot{4, "x"}), leafline::EntityType::Genre);
    QCOMPARE(leafline::snapshotId(leafline::GenreSnapshot{4, "x"}), std::int64_t{4});
}

void SnapshotCodecTests::testReadingPayload()
{
    leafline::ReadingSnapshot reading;
    reading.id = 9;
    reading.userId = 1;
    reading.bookId = 5;
    reading.bookTitle = "Dune";
    reading.authors = {"Frank Herbert"};
    reading.status = leafline::ReadingStatus::Read;
    reading.format = leafline::ReadingFormat::EReader;
    reading.rating = 4.5;

    const auto payload = leafline::buildPayload(reading);
    QCOMPARE(QString::fromStdString(payload.title), QStringLiteral("Dune"));
    QVERIFY(!payload.genresJson.has_value());

    const auto details = leafline::decodeDetails(payload.detailsJson);
    QCOMPARE(details.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(details.at(1).label), QStringLiteral("Format"));
    QCOMPARE(QString::fromStdString(details.at(1).value), QStringLiteral("eReader"));
    QCOMPARE(QString::fromStdString(details.at(2).value), QStringLiteral("4.5/5"));

    const auto data = leafline::decodeReadingData(payload.readingDataJson);
    QVERIFY(data.has_value());
    QCOMPARE(data->bookId, std::int64_t{5});
    QCOMPARE(data->status, leafline::ReadingStatus::Read);
    QCOMPARE(*data->rating, 4.5);
}

void SnapshotCodecTests::testMissingFieldsRejected()
{
    QVERIFY(throwsError<leafline::ValidationError>(
        [] { leafline::buildPayload(leafline::BookSnapshot{}); }));
    QVERIFY(throwsError<leafline::ValidationError>(
        [] { leafline::buildPayload(leafline::AuthorSnapshot{1, ""}); }));

    leafline::ReadingSnapshot orphan;
    orphan.id = 1;
    orphan.userId = 1;
    orphan.bookTitle = "Dune";
    QVERIFY(throwsError<leafline::ValidationError>([&] { leafline::buildPayload(orphan); }));

    leafline::ReadingSnapshot badRating;
    badRating.id = 1;
    badRating.bookId = 1;
    badRating.bookTitle = "Dune";
    badRating.rating = 4.2;
    QVERIFY(throwsError<leafline::ValidationError>([&] { leafline::buildPayload(badRating); }));
}

void SnapshotCodecTests::testDeterministic()
{
    leafline::ReadingSnapshot reading;
    reading.id = 9;
    reading.bookId = 5;
    reading.bookTitle = "Dune";
    reading.rating = 3.0;

    const auto a = leafline::buildPayload(reading);
    const auto b = leafline::buildPayload(reading);
    QVERIFY(a == b);
    QCOMPARE(QString::fromStdString(*a.readingDataJson),
             QStringLiteral(R"({"book_id":5,"rating":3.0,"status":"reading"})"));
}

void SnapshotCodecTests::testRatings()
{
    QCOMPARE(QString::fromStdString(leafline::formatRating(4.0)), QStringLiteral("4/5"));
    QCOMPARE(QString::fromStdString(leafline::formatRating(3.5)), QStringLiteral("3.5/5"));
    QCOMPARE(QString::fromStdString(leafline::formatRating(0.5)), QStringLiteral("0.5/5"));

    QVERIFY(leafline::isValidRating(0.5));
    QVERIFY(leafline::isValidRating(5.0));
    QVERIFY(!leafline::isValidRating(0.0));
    QVERIFY(!leafline::isValidRating(5.5));
    QVERIFY(!leafline::isValidRating(2.25));

    QCOMPARE(QString::fromStdString(leafline::formatLabel(leafline::ReadingFormat::Audiobook)),
             QStringLiteral("Audiobook"));
}

void SnapshotCodecTests::testToEntryToleratesBadJson()
{
    leafline::TimelineEvent event;
    event.id = 3;
    event.entityType = leafline::EntityType::Book;
    event.entityId = 8;
    event.action = "updated";
    event.payload.title = "Emma";
    event.payload.detailsJson = "not json";
    event.payload.genresJson = "{}";

    const auto entry = leafline::toEntry(event);
    QCOMPARE(QString::fromStdString(entry.title), QStringLiteral("Emma"));
    QCOMPARE(QString::fromStdString(entry.action), QStringLiteral("updated"));
    QVERIFY(entry.details.empty());
    QVERIFY(!entry.genres.has_value());
    QVERIFY(!entry.readingData.has_value());
}

QTEST_MAIN(SnapshotCodecTests)
#include "test_snapshot_codec.moc"
