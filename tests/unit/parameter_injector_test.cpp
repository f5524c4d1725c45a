#include "internal/workflow/parameter_injector.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/fakes/media_fixtures.hpp"

namespace {

using lipsync::workflow::DefaultRoleBindings;
using lipsync::workflow::FrameBudget;
using lipsync::workflow::InjectionParams;
using lipsync::workflow::JobGraph;
using lipsync::workflow::NodeIdLess;
using lipsync::workflow::ParameterInjector;
using lipsync::workflow::Role;
using lipsync::workflow::RoleTable;

const char* kStockTemplate = R"({
  "125": {"class_type": "LoadAudio", "inputs": {"audio": "placeholder.wav"}},
  "128": {"class_type": "WanVideoSampler", "inputs": {"steps": 4, "force_offload": true}},
  "241": {"class_type": "WanVideoTextEncodeCached", "inputs": {"positive_prompt": "placeholder"}},
  "245": {"class_type": "INTConstant", "_meta": {"title": "Width"}, "inputs": {"value": 512}},
  "246": {"class_type": "INTConstant", "_meta": {"title": "Height"}, "inputs": {"value": 512}},
  "270": {"class_type": "INTConstant", "_meta": {"title": "Max frames"}, "inputs": {"value": 81}},
  "284": {"class_type": "LoadImage", "inputs": {"image": "placeholder.jpg"}},
  "300": {"class_type": "VHS_VideoCombine", "inputs": {"images": ["128", 0], "frame_rate": 25}}
})";

std::filesystem::path Dir() {
  const auto dir = std::filesystem::temp_directory_path() / "lipsync_parameter_injector_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

InjectionParams ImageParams() {
  InjectionParams params;
  params.primary       = "/work/task_1/input_image.jpg";
  params.audio         = "/work/task_1/input_audio.wav";
  params.prompt        = "A person talking naturally";
  params.width         = 384;
  params.height        = 640;
  params.force_offload = false;
  params.frame_count   = 200;
  return params;
}

ParameterInjector MakeInjector() {
  return ParameterInjector(DefaultRoleBindings(), FrameBudget{}, {});
}

std::string StringInput(const JobGraph& graph, const std::string& node, const std::string& field) {
  const auto* value = graph.Input(node, field);
  assert(value != nullptr);
  return value->string_value();
}

double NumberInput(const JobGraph& graph, const std::string& node, const std::string& field) {
  const auto* value = graph.Input(node, field);
  assert(value != nullptr);
  return value->number_value();
}

void TestNodeIdOrdering() {
  assert(NodeIdLess("9", "10"));
  assert(!NodeIdLess("10", "9"));
  assert(NodeIdLess("284", "1000"));
  assert(NodeIdLess("999", "abc"));
  assert(NodeIdLess("abc", "abd"));

  const auto graph = JobGraph::FromJson(R"({"100": {"class_type": "A"}, "20": {"class_type": "B"}, "3": {"class_type": "C"}})");
  const auto ids   = graph.NodeIds();
  assert((ids == std::vector<std::string>{"3", "20", "100"}));
}

void TestStockTemplateIsFullyInjected() {
  const auto graph_template = JobGraph::FromJson(kStockTemplate);
  const auto graph          = MakeInjector().Inject(graph_template, ImageParams());

  assert(StringInput(graph, "284", "image") == "/work/task_1/input_image.jpg");
  assert(StringInput(graph, "125", "audio") == "/work/task_1/input_audio.wav");
  assert(StringInput(graph, "241", "positive_prompt") == "A person talking naturally");
  assert(NumberInput(graph, "245", "value") == 384);
  assert(NumberInput(graph, "246", "value") == 640);
  assert(NumberInput(graph, "270", "value") == 200);
  assert(graph.Input("128", "force_offload")->bool_value() == false);
  assert(NumberInput(graph, "128", "steps") == 4);

  // links and the template itself are untouched
  assert(graph.Input("300", "images")->list_value().values(0).string_value() == "128");
  assert(StringInput(graph_template, "284", "image") == "placeholder.jpg");
  assert(graph_template.Input("128", "force_offload")->bool_value() == true);
}

void TestPreferredIdWinsOverEarlierMatch() {
  auto graph_template = JobGraph::FromJson(kStockTemplate);
  auto with_decoy     = JobGraph::FromJson(R"({
    "12": {"class_type": "LoadImage", "inputs": {"image": "decoy.jpg"}},
    "125": {"class_type": "LoadAudio", "inputs": {}},
    "241": {"class_type": "WanVideoTextEncode", "inputs": {}},
    "284": {"class_type": "LoadImage", "inputs": {"image": "placeholder.jpg"}}
  })");

  const auto graph = MakeInjector().Inject(with_decoy, ImageParams());
  assert(StringInput(graph, "284", "image") == "/work/task_1/input_image.jpg");
  assert(StringInput(graph, "12", "image") == "decoy.jpg");

  const auto table = RoleTable::Build(graph_template, DefaultRoleBindings(), {});
  assert(*table.NodeFor(Role::kImage) == "284");
  assert(*table.NodeFor(Role::kOffload) == "128");
}

void TestFallbackSearchUsesNumericOrder() {
  const auto graph_template = JobGraph::FromJson(R"({
    "100": {"class_type": "LoadImage", "inputs": {"image": "a.jpg"}},
    "90": {"class_type": "LoadImage", "inputs": {"image": "b.jpg"}},
    "7": {"class_type": "LoadAudio", "inputs": {"audio": "x.wav"}},
    "8": {"class_type": "WanVideoTextEncode", "inputs": {}},
    "128": {"class_type": "KSampler", "inputs": {}},
    "40": {"class_type": "WanVideoSampler", "inputs": {}},
    "11": {"class_type": "INTConstant", "_meta": {"title": "width"}, "inputs": {"value": 1}},
    "10": {"class_type": "INTConstant", "_meta": {"title": "Height"}, "inputs": {"value": 1}}
  })");

  const auto graph = MakeInjector().Inject(graph_template, ImageParams());
  assert(StringInput(graph, "90", "image") == "/work/task_1/input_image.jpg");
  assert(StringInput(graph, "100", "image") == "a.jpg");
  assert(StringInput(graph, "7", "audio") == "/work/task_1/input_audio.wav");
  assert(NumberInput(graph, "11", "value") == 384);
  assert(NumberInput(graph, "10", "value") == 640);

  // preferred id 128 exists but is not a WanVideoSampler
  assert(graph.Input("40", "force_offload")->bool_value() == false);
  assert(graph.Input("128", "force_offload") == nullptr);
}

void TestMissingInputsMapIsCreated() {
  const auto graph_template = JobGraph::FromJson(R"({
    "125": {"class_type": "LoadAudio"},
    "241": {"class_type": "WanVideoTextEncode"},
    "284": {"class_type": "LoadImage"},
    "128": {"class_type": "WanVideoSampler"}
  })");

  const auto graph = MakeInjector().Inject(graph_template, ImageParams());
  assert(StringInput(graph, "284", "image") == "/work/task_1/input_image.jpg");
  assert(graph.Input("128", "force_offload")->bool_value() == false);
}

void TestMissingRequiredRoleIsValidationError() {
  const auto graph_template = JobGraph::FromJson(R"({
    "241": {"class_type": "WanVideoTextEncode", "inputs": {}},
    "284": {"class_type": "LoadImage", "inputs": {}}
  })");

  bool threw = false;
  try {
    (void)MakeInjector().Inject(graph_template, ImageParams());
  } catch (const lipsync::util::ValidationError& e) {
    threw = std::string(e.what()).find("audio") != std::string::npos;
  }
  assert(threw);
}

void TestMissingOptionalRolesKeepTemplate() {
  const auto graph_template = JobGraph::FromJson(R"({
    "125": {"class_type": "LoadAudio", "inputs": {}},
    "241": {"class_type": "WanVideoTextEncode", "inputs": {}},
    "284": {"class_type": "LoadImage", "inputs": {}},
    "500": {"class_type": "INTConstant", "_meta": {"title": "Steps"}, "inputs": {"value": 6}}
  })");

  const auto graph = MakeInjector().Inject(graph_template, ImageParams());
  assert(NumberInput(graph, "500", "value") == 6);
  assert(StringInput(graph, "284", "image") == "/work/task_1/input_image.jpg");
}

void TestVideoModeUsesVideoLoader() {
  const auto graph_template = JobGraph::FromJson(R"({
    "125": {"class_type": "LoadAudio", "inputs": {}},
    "228": {"class_type": "VHS_LoadVideo", "inputs": {"video": "placeholder.mp4", "force_rate": 25}},
    "241": {"class_type": "WanVideoTextEncode", "inputs": {}}
  })");

  auto params         = ImageParams();
  params.primary_kind = lipsync::input::MediaKind::kVideo;
  params.primary      = "/work/task_2/input_video.mp4";

  const auto graph = MakeInjector().Inject(graph_template, params);
  assert(StringInput(graph, "228", "video") == "/work/task_2/input_video.mp4");
  assert(NumberInput(graph, "228", "force_rate") == 25);
}

void TestFrameCountDerivedFromAudio() {
  const auto wav = Dir() / "two_seconds.wav";
  lipsync::testing::WriteWav(wav, 2.0);

  auto params = ImageParams();
  params.audio = wav;
  params.frame_count.reset();

  const auto graph = MakeInjector().Inject(JobGraph::FromJson(kStockTemplate), params);
  assert(NumberInput(graph, "270", "value") == 131);
}

void TestConfigOverridesBinding() {
  lipsync::runtime::config::WorkflowConfig workflow;
  auto& offload = (*workflow.mutable_roles())["offload"];
  offload.set_preferred_id("300");
  offload.add_class_types("VHS_VideoCombine");
  offload.set_field("save_output");

  const auto bindings = lipsync::workflow::MergeRoleBindings(DefaultRoleBindings(), workflow.roles());
  assert(bindings.at(Role::kOffload).preferred_id == "300");
  assert(bindings.at(Role::kOffload).field == "save_output");
  assert(!bindings.at(Role::kOffload).required);
  assert(bindings.at(Role::kImage).preferred_id == "284");

  ParameterInjector injector(bindings, FrameBudget{}, {});
  const auto        graph = injector.Inject(JobGraph::FromJson(kStockTemplate), ImageParams());
  assert(graph.Input("300", "save_output")->bool_value() == false);
}

void TestMalformedTemplateIsValidationError() {
  bool threw = false;
  try {
    (void)JobGraph::FromJson("[1, 2, 3]");
  } catch (const lipsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)JobGraph::LoadFile(Dir() / "no_such_template.json");
  } catch (const lipsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNodeIdOrdering();
  TestStockTemplateIsFullyInjected();
  TestPreferredIdWinsOverEarlierMatch();
  TestFallbackSearchUsesNumericOrder();
  TestMissingInputsMapIsCreated();
  TestMissingRequiredRoleIsValidationError();
  TestMissingOptionalRolesKeepTemplate();
  TestVideoModeUsesVideoLoader();
  TestFrameCountDerivedFromAudio();
  TestConfigOverridesBinding();
  TestMalformedTemplateIsValidationError();

  std::cout << "lipsync_unit_parameter_injector: pass\n";
  return 0;
}
