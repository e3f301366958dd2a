#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include "pipeline/video_transcoding_pipeline.hpp"
#include "media/mime_types.hpp"
#include "fake_pipeline_stages.hpp"

using namespace vt;
using namespace vt::pipeline;
using vt::testing::EventLog;
using vt::testing::FakeDecoderFactory;
using vt::testing::FakeEncoderFactory;
using vt::testing::FakeTransformer;

namespace {

media::Format input_format(int width, int height, int rotation = 0) {
    media::Format f;
    f.sample_mime_type = media::mime::kVideoH264;
    f.width = width;
    f.height = height;
    f.rotation_degrees = rotation;
    f.frame_rate = 30.0f;
    return f;
}

struct Harness {
    EventLog events;
    FakeDecoderFactory decoders{events};
    FakeEncoderFactory encoders{events};
    FakeTransformer* transformer = nullptr;
    bool auto_deliver = true;
    int fallback_calls = 0;
    TransformationRequest fallback;

    TransformerFactory transformer_factory() {
        return [this](const transformer::FrameTransformerParams& params, media::Surface& output) {
            auto t = std::make_unique<FakeTransformer>(params, output, events);
            t->auto_deliver = auto_deliver;
            transformer = t.get();
            return std::unique_ptr<transformer::IFrameTransformer>(std::move(t));
        };
    }

    std::unique_ptr<VideoTranscodingPipeline> make(const media::Format& input,
                                                   const TransformationRequest& request,
                                                   DrainStrategy strategy) {
        return std::make_unique<VideoTranscodingPipeline>(
            input, request, decoders, encoders, transformer_factory(),
            std::vector<std::string>{media::mime::kVideoH264, media::mime::kVideoH265},
            [this](const TransformationRequest& r) { ++fallback_calls; fallback = r; },
            strategy);
    }
};

// Feeds |frames| samples plus end of stream and drives the pipeline until the
// encoder ends. Returns the timestamps of the encoded samples.
std::vector<int64_t> run_to_end(VideoTranscodingPipeline& p, int frames, Harness* h = nullptr) {
    std::vector<int64_t> out;
    int queued = 0;
    bool eos_queued = false;
    for(int guard = 0; guard < 10000 && !p.is_ended(); ++guard) {
        if(!eos_queued) {
            if(media::SampleBuffer* buffer = p.dequeue_input_buffer()) {
                if(queued < frames) {
                    buffer->data = {0, 0, 1};
                    buffer->time_us = queued * 33'333;
                    ++queued;
                } else {
                    buffer->set_flags(media::kBufferFlagEndOfStream);
                    eos_queued = true;
                }
                p.queue_input_buffer();
            }
        }
        while(p.process_data()) {}
        if(h && h->transformer && h->transformer->undelivered > 0) {
            h->transformer->deliver_one();
        }
        while(media::SampleBuffer* sample = p.get_output_buffer()) {
            out.push_back(sample->time_us);
            p.release_output_buffer();
        }
    }
    return out;
}

} // namespace

TEST_CASE("pipeline without transformation renders straight to the encoder", "[pipeline]") {
    Harness h;
    auto p = h.make(input_format(1920, 1080), TransformationRequest{}, DrainStrategy::Batch);
    REQUIRE_FALSE(p->has_frame_transformer());
    REQUIRE(h.transformer == nullptr);
    REQUIRE(p->output_rotation_degrees() == 0);

    auto out = run_to_end(*p, 10);
    REQUIRE(p->is_ended());
    REQUIRE(out.size() == 10);
    REQUIRE(h.encoders.last->received_timestamps().size() == 10);
    REQUIRE(h.encoders.last->end_of_input_signals == 1);
    REQUIRE(std::is_sorted(out.begin(), out.end()));
}

TEST_CASE("pipeline transforms every frame with both drain strategies", "[pipeline]") {
    for(DrainStrategy strategy : {DrainStrategy::Batch, DrainStrategy::SingleFrame}) {
        Harness h;
        TransformationRequest request;
        request.output_height = 720;
        auto p = h.make(input_format(1920, 1080), request, strategy);
        REQUIRE(p->has_frame_transformer());
        REQUIRE(p->drain_strategy() == strategy);

        auto out = run_to_end(*p, 25);
        REQUIRE(p->is_ended());
        REQUIRE(out.size() == 25);
        REQUIRE(h.transformer->processed == 25);
        REQUIRE(h.transformer->is_ended());
        REQUIRE(h.encoders.last->end_of_input_signals == 1);
    }
}

TEST_CASE("single frame drain keeps at most one frame between decoder and transformer", "[pipeline]") {
    Harness h;
    h.auto_deliver = false;
    h.decoders.capacity = 8;
    TransformationRequest request;
    request.output_height = 540;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::SingleFrame);

    for(int i = 0; i < 4; ++i) {
        media::SampleBuffer* buffer = p->dequeue_input_buffer();
        REQUIRE(buffer != nullptr);
        buffer->time_us = i;
        p->queue_input_buffer();
    }

    // One frame is released for rendering, then the pipeline waits for it.
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->rendered == 1);
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->rendered == 1);

    h.transformer->deliver_one();
    REQUIRE(p->process_data());
    REQUIRE(h.transformer->processed == 1);
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->rendered == 2);
}

TEST_CASE("batch drain releases all decoded frames in one call", "[pipeline]") {
    Harness h;
    h.auto_deliver = false;
    h.decoders.capacity = 8;
    TransformationRequest request;
    request.output_height = 540;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);

    for(int i = 0; i < 5; ++i) {
        media::SampleBuffer* buffer = p->dequeue_input_buffer();
        REQUIRE(buffer != nullptr);
        buffer->time_us = i;
        p->queue_input_buffer();
    }
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->rendered == 5);
    REQUIRE(h.transformer->undelivered == 5);

    h.transformer->deliver_one();
    h.transformer->deliver_one();
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.transformer->processed == 2);
}

TEST_CASE("encoder end of input is signaled once, after decoder and transformer end", "[pipeline]") {
    for(DrainStrategy strategy : {DrainStrategy::Batch, DrainStrategy::SingleFrame}) {
        Harness h;
        h.auto_deliver = false;
        TransformationRequest request;
        request.transformation_matrix = gfx::Matrix::scale(0.5f, 0.5f);
        auto p = h.make(input_format(1280, 720), request, strategy);
        REQUIRE(p->has_frame_transformer());

        h.encoders.last->on_end_of_input = [&] {
            CHECK(h.decoders.last->is_ended());
            CHECK(h.transformer->is_ended());
        };

        auto out = run_to_end(*p, 6, &h);
        REQUIRE(out.size() == 6);
        REQUIRE(h.encoders.last->end_of_input_signals == 1);

        // Further polling after the end does nothing.
        REQUIRE_FALSE(p->process_data());
        REQUIRE(h.encoders.last->end_of_input_signals == 1);
    }
}

TEST_CASE("encoder end of input waits for undelivered frames", "[pipeline]") {
    Harness h;
    h.auto_deliver = false;
    TransformationRequest request;
    request.output_height = 540;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);

    media::SampleBuffer* buffer = p->dequeue_input_buffer();
    REQUIRE(buffer != nullptr);
    p->queue_input_buffer();
    buffer = p->dequeue_input_buffer();
    REQUIRE(buffer != nullptr);
    buffer->set_flags(media::kBufferFlagEndOfStream);
    p->queue_input_buffer();

    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->is_ended());
    REQUIRE(h.encoders.last->end_of_input_signals == 0);

    h.transformer->deliver_one();
    p->process_data();
    p->process_data();
    REQUIRE(h.transformer->is_ended());
    REQUIRE(h.encoders.last->end_of_input_signals == 1);
}

TEST_CASE("pipeline reports the fallback request exactly once", "[pipeline]") {
    SECTION("granted format matches the request") {
        Harness h;
        auto p = h.make(input_format(1920, 1080), TransformationRequest{}, DrainStrategy::Batch);
        REQUIRE(h.fallback_calls == 1);
        REQUIRE(h.fallback == TransformationRequest{});
    }
    SECTION("encoder grants a smaller width") {
        Harness h;
        h.encoders.granted_width = 1280;
        h.encoders.granted_height = 720;
        auto p = h.make(input_format(1920, 1080), TransformationRequest{}, DrainStrategy::Batch);
        REQUIRE(h.fallback_calls == 1);
        REQUIRE(h.fallback.output_height == 1280);
        REQUIRE(h.fallback.video_mime_type == media::mime::kVideoH264);
        // The granted size differs from the decoded size, so frames are scaled.
        REQUIRE(p->has_frame_transformer());
        REQUIRE(h.transformer->params.output_width == 1280);
        REQUIRE(h.transformer->params.output_height == 720);
    }
    SECTION("encoder grants another mime type") {
        Harness h;
        h.encoders.granted_mime_type = media::mime::kVideoH265;
        auto p = h.make(input_format(1920, 1080), TransformationRequest{}, DrainStrategy::Batch);
        REQUIRE(h.fallback_calls == 1);
        REQUIRE(h.fallback.video_mime_type == media::mime::kVideoH265);
        REQUIRE(h.fallback.output_height == 1920);
    }
}

TEST_CASE("portrait output is encoded landscape and tagged with a rotation", "[pipeline]") {
    Harness h;
    TransformationRequest request;
    request.transformation_matrix = gfx::Matrix::rotate(90.0f);
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);

    REQUIRE(p->output_rotation_degrees() == 90);
    REQUIRE(h.encoders.requested.width == 1920);
    REQUIRE(h.encoders.requested.height == 1080);
    REQUIRE(h.encoders.requested.rotation_degrees == 0);

    auto format = p->get_output_format();
    REQUIRE(format.has_value());
    REQUIRE(format->rotation_degrees == 90);
}

TEST_CASE("rotation hint alone needs no transformer", "[pipeline]") {
    Harness h;
    auto p = h.make(input_format(1080, 1920, 90), TransformationRequest{}, DrainStrategy::Batch);
    REQUIRE(h.encoders.requested.width == 1920);
    REQUIRE(h.encoders.requested.height == 1080);
    REQUIRE(p->output_rotation_degrees() == 0);
    REQUIRE_FALSE(p->has_frame_transformer());
}

TEST_CASE("hdr editing always uses the transformer", "[pipeline]") {
    Harness h;
    TransformationRequest request;
    request.enable_hdr_editing = true;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);
    REQUIRE(p->has_frame_transformer());
    REQUIRE(h.transformer->params.enable_hdr_editing);
}

TEST_CASE("release tears down transformer, decoder and encoder once each", "[pipeline]") {
    Harness h;
    TransformationRequest request;
    request.output_height = 720;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);
    p->release();
    p->release();
    p.reset();
    REQUIRE(h.events == EventLog{"transformer.release", "decoder.release", "encoder.release"});
}

TEST_CASE("failed transformer creation releases the encoder", "[pipeline]") {
    Harness h;
    TransformerFactory failing = [](const transformer::FrameTransformerParams&, media::Surface&)
        -> std::unique_ptr<transformer::IFrameTransformer> {
        throw TranscodeError(ErrorCode::GlInitFailed, "no display");
    };
    TransformationRequest request;
    request.output_height = 720;
    bool thrown = false;
    try {
        VideoTranscodingPipeline p(input_format(1920, 1080), request, h.decoders, h.encoders, failing,
                                   {}, {}, DrainStrategy::Batch);
    } catch(const TranscodeError& e) {
        thrown = true;
        REQUIRE(e.code() == ErrorCode::GlInitFailed);
        REQUIRE(e.is_configuration_error());
    }
    REQUIRE(thrown);
    REQUIRE(h.events == EventLog{"encoder.release"});
    REQUIRE(h.decoders.last == nullptr);
}

TEST_CASE("full encoder output stalls the pipeline until samples are pulled", "[pipeline][backpressure]") {
    for(DrainStrategy strategy : {DrainStrategy::Batch, DrainStrategy::SingleFrame}) {
        for(bool transform : {false, true}) {
            Harness h;
            h.decoders.capacity = 8;
            TransformationRequest request;
            if(transform) request.output_height = 540;
            auto p = h.make(input_format(1920, 1080), request, strategy);
            REQUIRE(p->has_frame_transformer() == transform);
            h.encoders.last->output_capacity = 2;

            for(int i = 0; i < 6; ++i) {
                media::SampleBuffer* buffer = p->dequeue_input_buffer();
                REQUIRE(buffer != nullptr);
                buffer->time_us = i * 1000;
                p->queue_input_buffer();
            }
            media::SampleBuffer* eos = p->dequeue_input_buffer();
            REQUIRE(eos != nullptr);
            eos->set_flags(media::kBufferFlagEndOfStream);
            p->queue_input_buffer();

            // Nobody reads output: progress stops at the encoder's capacity.
            for(int i = 0; i < 50; ++i) p->process_data();
            REQUIRE(h.encoders.last->pending_outputs() == 2);
            REQUIRE_FALSE(p->process_data());
            REQUIRE(h.encoders.last->end_of_input_signals == 0);

            std::vector<int64_t> out;
            for(int guard = 0; guard < 1000 && !p->is_ended(); ++guard) {
                while(p->process_data()) {}
                while(media::SampleBuffer* sample = p->get_output_buffer()) {
                    out.push_back(sample->time_us);
                    p->release_output_buffer();
                }
            }
            REQUIRE(p->is_ended());
            REQUIRE(out == std::vector<int64_t>{0, 1000, 2000, 3000, 4000, 5000});
            REQUIRE(h.encoders.last->end_of_input_signals == 1);
        }
    }
}

TEST_CASE("full transformer input holds back decoded frames", "[pipeline][backpressure]") {
    Harness h;
    h.auto_deliver = false;
    h.decoders.capacity = 8;
    TransformationRequest request;
    request.output_height = 540;
    auto p = h.make(input_format(1920, 1080), request, DrainStrategy::Batch);
    h.transformer->input_capacity = 3;

    for(int i = 0; i < 6; ++i) {
        media::SampleBuffer* buffer = p->dequeue_input_buffer();
        REQUIRE(buffer != nullptr);
        p->queue_input_buffer();
    }
    REQUIRE_FALSE(p->process_data());
    REQUIRE(h.decoders.last->rendered == 3);

    h.transformer->deliver_one();
    p->process_data();
    REQUIRE(h.transformer->processed == 1);
    REQUIRE(h.decoders.last->rendered == 4);
}
