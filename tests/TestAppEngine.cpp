#include <future>
#include <memory>

#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QScopeGuard>
#include <QTemporaryDir>

#include "AppEngine.h"
#include "ModelMgr.h"
#include "TestDoubles.h"

using namespace test;

class TestAppEngine : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testInitialState();
    void testControlTable();
    void testEmptyPathIsRejected();
    void testMissingFileIsRejected();
    void testSuccessfulTranscription();
    void testStartIsIgnoredWhileRunning();
    void testFailedTranscription();
    void testOutputWriteFailure();
    void testModelSelectionIsPersisted();
    void testSaveTranscript();

private:
    std::unique_ptr<AppEngine> makeEngine(FakeEngine::Behavior behavior = {},
                                          std::shared_ptr<AudioDecoder> decoder = {});

    std::unique_ptr<QTemporaryDir> tmp_;
    std::shared_ptr<FakeEngine> engine_;
};

void TestAppEngine::initTestCase()
{
    QCoreApplication::setOrganizationName("QScribeTest");
    QCoreApplication::setApplicationName("TestAppEngine");
}

void TestAppEngine::init()
{
    QSettings{}.clear();
    tmp_ = std::make_unique<QTemporaryDir>();
    QVERIFY(tmp_->isValid());
    prepareModelDir(*tmp_, catalogFiles());
}

void TestAppEngine::cleanup()
{
    engine_.reset();
    tmp_.reset();
}

std::unique_ptr<AppEngine> TestAppEngine::makeEngine(FakeEngine::Behavior behavior,
                                                     std::shared_ptr<AudioDecoder> decoder)
{
    engine_ = std::make_shared<FakeEngine>(std::move(behavior));
    if (!decoder) {
        decoder = std::make_shared<FakeDecoder>();
    }
    auto app = std::make_unique<AppEngine>(std::make_shared<ModelMgr>(engine_), std::move(decoder));
    app->setOutputDir(tmp_->path());
    return app;
}

void TestAppEngine::testInitialState()
{
    auto app = makeEngine();

    QCOMPARE(app->state(), AppEngine::UiState::Idle);
    QVERIFY(app->audioPathEnabled());
    QVERIFY(app->browseEnabled());
    QVERIFY(app->modelEnabled());
    QVERIFY(app->startEnabled());
    QVERIFY(!app->busyVisible());
    QCOMPARE(app->startButtonText(), QStringLiteral("Start Transcription"));
    QVERIFY(app->transcriptText().contains("FFmpeg"));
    QCOMPARE(app->downloadProgress(), -1.0);
    QVERIFY(!app->hasActiveTask());

    // medium is the default
    QCOMPARE(app->models()->rowCount(), 4);
    QCOMPARE(app->models()->selectedModelName(), QStringLiteral("medium"));
}

void TestAppEngine::testControlTable()
{
    auto app = makeEngine();
    QVERIFY(app->isEnabled(AppEngine::Control::Start));
    QVERIFY(!app->isEnabled(AppEngine::Control::BusyIndicator));
    QVERIFY(!app->isEnabled(AppEngine::Control::Count));
}

void TestAppEngine::testEmptyPathIsRejected()
{
    auto app = makeEngine();
    QSignalSpy validation{app.get(), &AppEngine::validationFailed};
    QSignalSpy state{app.get(), &AppEngine::stateChanged};

    app->startTranscription();

    QCOMPARE(validation.count(), 1);
    QCOMPARE(validation.at(0).at(0).toString(),
             QStringLiteral("Please select a valid audio file before starting transcription."));
    QCOMPARE(app->validationMessage(), validation.at(0).at(0).toString());
    QCOMPARE(state.count(), 0);
    QVERIFY(!app->hasActiveTask());
    QCOMPARE(engine_->loads.load(), 0);
}

void TestAppEngine::testMissingFileIsRejected()
{
    auto app = makeEngine();
    QSignalSpy validation{app.get(), &AppEngine::validationFailed};

    app->setAudioFile(QUrl::fromLocalFile(QDir{tmp_->path()}.filePath("missing.wav")));
    app->startTranscription();

    QCOMPARE(validation.count(), 1);
    QVERIFY(!app->hasActiveTask());
    QCOMPARE(app->state(), AppEngine::UiState::Idle);

    // A new selection clears the message
    app->setAudioPath(createFile(QDir{tmp_->path()}, "present.wav"));
    QVERIFY(app->validationMessage().isEmpty());
}

void TestAppEngine::testSuccessfulTranscription()
{
    auto app = makeEngine(FakeEngine::Behavior{.text = "Transcribed words."});
    QSignalSpy errors{app.get(), &AppEngine::errorOccurred};
    QSignalSpy flags{app.get(), &AppEngine::stateFlagsChanged};

    app->setAudioFile(QUrl::fromLocalFile(createFile(QDir{tmp_->path()}, "sample.wav")));
    app->models()->setSelected(0); // base
    app->startTranscription();

    QCOMPARE(app->state(), AppEngine::UiState::Running);
    QCOMPARE(flags.count(), 1);
    QVERIFY(!app->startEnabled());
    QVERIFY(app->busyVisible());

    QTRY_COMPARE(app->state(), AppEngine::UiState::Idle);
    QCOMPARE(flags.count(), 2);
    QCOMPARE(errors.count(), 0);
    QVERIFY(!app->hasActiveTask());
    QVERIFY(app->startEnabled());
    QCOMPARE(app->statusText(), QStringLiteral("Transcription finished! Output saved to disk."));
    QVERIFY(app->transcriptText().startsWith("Transcription complete in "));
    QVERIFY(app->transcriptText().endsWith("Full Transcript:\nTranscribed words."));

    QFile out{QDir{tmp_->path()}.filePath("sample_base_transcript.txt")};
    QVERIFY(out.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(out.readAll()), QStringLiteral("Transcribed words."));
}

void TestAppEngine::testStartIsIgnoredWhileRunning()
{
    std::promise<void> release;
    bool released = false;
    auto app = makeEngine(FakeEngine::Behavior{.gate = release.get_future().share()});

    // Open the gate if we bail out early, or the worker is never joined
    const auto open_gate = qScopeGuard([&] {
        if (!released) {
            release.set_value();
        }
    });

    app->setAudioPath(createFile(QDir{tmp_->path()}, "long.wav"));
    app->startTranscription();
    QVERIFY(app->hasActiveTask());
    QCOMPARE(app->startButtonText(), QStringLiteral("Processing..."));

    // Wait until the worker is inside the inference
    QTRY_VERIFY(app->statusText().startsWith("Model loaded successfully."));

    app->startTranscription();
    app->startTranscription();
    QCOMPARE(engine_->loads.load(), 1);

    release.set_value();
    released = true;

    QTRY_COMPARE(app->state(), AppEngine::UiState::Idle);
    QVERIFY(!app->hasActiveTask());
    QCOMPARE(engine_->loads.load(), 1);
    QCOMPARE(engine_->transcriptions.load(), 1);
}

void TestAppEngine::testFailedTranscription()
{
    auto app = makeEngine(FakeEngine::Behavior{.throw_on_transcribe = "disk full"});
    QSignalSpy errors{app.get(), &AppEngine::errorOccurred};

    app->setAudioPath(createFile(QDir{tmp_->path()}, "sample.wav"));
    app->startTranscription();

    QTRY_COMPARE(errors.count(), 1);
    QVERIFY(errors.at(0).at(0).toString().contains("disk full"));
    QCOMPARE(app->state(), AppEngine::UiState::Idle);
    QVERIFY(app->statusText().startsWith("ERROR: "));
    QVERIFY(!app->hasActiveTask());
    QVERIFY(app->audioPathEnabled());
    QVERIFY(!QFile::exists(QDir{tmp_->path()}.filePath("sample_medium_transcript.txt")));
}

void TestAppEngine::testOutputWriteFailure()
{
    auto app = makeEngine();
    const auto out_dir = QDir{tmp_->path()}.filePath("no/such/dir");
    app->setOutputDir(out_dir);
    QSignalSpy errors{app.get(), &AppEngine::errorOccurred};

    app->setAudioPath(createFile(QDir{tmp_->path()}, "sample.wav"));
    app->startTranscription();

    QTRY_COMPARE(errors.count(), 1);
    QVERIFY(errors.at(0).at(0).toString().startsWith("An unexpected error occurred: "));
    QCOMPARE(app->state(), AppEngine::UiState::Idle);
    QVERIFY(app->startEnabled());
    QVERIFY(!app->hasActiveTask());
    QVERIFY(!QFile::exists(QDir{out_dir}.filePath("sample_medium_transcript.txt")));
}

void TestAppEngine::testModelSelectionIsPersisted()
{
    {
        auto app = makeEngine();
        app->models()->setSelected(1);
        QCOMPARE(app->models()->selectedModelName(), QStringLiteral("small"));
    }

    QCOMPARE(QSettings{}.value("transcribe/model").toString(), QStringLiteral("small-q5_1"));

    auto app = makeEngine();
    QCOMPARE(app->models()->selected(), 1);
}

void TestAppEngine::testSaveTranscript()
{
    auto app = makeEngine();
    const auto path = QDir{tmp_->path()}.filePath("copy.txt");
    app->saveTranscriptToFile(QUrl::fromLocalFile(path));

    QFile f{path};
    QVERIFY(f.open(QIODevice::ReadOnly));
    QCOMPARE(QString::fromUtf8(f.readAll()), app->transcriptText());
}

QTEST_GUILESS_MAIN(TestAppEngine)
#include "TestAppEngine.moc"
