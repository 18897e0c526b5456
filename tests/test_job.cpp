#include <catch2/catch_test_macros.hpp>

#include "job.hpp"

TEST_CASE("Job construction", "[job]") {

    SECTION("DisplayNameWins") {
        AudioDescriptor audio{.source_id = "audio_456", .declared_size = 2048,
                              .mime_type = "audio/mp3", .display_name = "song.mp3",
                              .unique_id = "u1"};
        auto job = make_job(audio, 123, 1, 2);
        REQUIRE(job.resolved_file_name == "song.mp3");
        REQUIRE(job.source_id == "audio_456");
        REQUIRE(job.mime_type == "audio/mp3");
        REQUIRE(job.declared_size == 2048);
        REQUIRE(job.chat_id == 123);
        REQUIRE(job.source_message_id == 1);
        REQUIRE(job.status_message_id == 2);
    }

    SECTION("VoiceMessageName") {
        AudioDescriptor audio{.source_id = "voice_789", .declared_size = 512 * 1024,
                              .mime_type = "audio/ogg", .unique_id = "unique_789"};
        REQUIRE(resolve_file_name(audio) == "voice_message.ogg");
    }

    SECTION("SynthesizedName") {
        AudioDescriptor audio{.source_id = "x", .declared_size = 1,
                              .mime_type = "audio/mp3", .unique_id = "unique_audio_456"};
        REQUIRE(resolve_file_name(audio) == "audio_file_unique_audio_456.mp3");
    }

    SECTION("EmptyDisplayNameTreatedAsAbsent") {
        AudioDescriptor audio{.source_id = "x", .declared_size = 1, .mime_type = "audio/wav",
                              .display_name = "", .unique_id = "abc"};
        REQUIRE(resolve_file_name(audio) == "audio_file_abc.wav");
    }

    SECTION("MimeWithoutSubtype") {
        AudioDescriptor audio{.source_id = "x", .declared_size = 1, .mime_type = "audio",
                              .unique_id = "abc"};
        REQUIRE(resolve_file_name(audio) == "audio_file_abc.bin");
    }
}
