#include "sandpool/backends/kubernetes_driver.hpp"

#include <gtest/gtest.h>

using namespace sandpool;
using backends::KubernetesDriver;

namespace {

backends::ContainerSpec MakeSpec() {
    backends::ContainerSpec spec;
    spec.name = "runtime_sandbox_container_abc123";
    spec.image = "agentscope/runtime-sandbox-base:latest";
    spec.host_port = 30123;
    spec.container_port = 80;
    spec.environment["SECRET_TOKEN"] = "tok";
    spec.mounts.push_back(utils::VolumeMount{"/srv/mounts/abc123", "/workspace", false});
    spec.memory_limit = "2g";
    spec.cpu_limit = "1.5";
    spec.labels["sandpool.type"] = "base";
    return spec;
}

} // namespace

TEST(KubernetesDriverTest, SanitizeNameProducesDnsLabel) {
    EXPECT_EQ("runtime-sandbox-container-abc", KubernetesDriver::SanitizeName("Runtime_Sandbox_Container_ABC"));
    EXPECT_EQ("a-b", KubernetesDriver::SanitizeName("__a.b__"));
    EXPECT_EQ("sandbox", KubernetesDriver::SanitizeName("___"));

    // Leaves room for the service suffix
    auto long_name = KubernetesDriver::SanitizeName(std::string(80, 'x'));
    EXPECT_EQ(63u - 8u, long_name.size());
}

TEST(KubernetesDriverTest, ToQuantityConvertsDockerSuffixes) {
    EXPECT_EQ("2Gi", KubernetesDriver::ToQuantity("2g"));
    EXPECT_EQ("512Mi", KubernetesDriver::ToQuantity("512M"));
    EXPECT_EQ("64Ki", KubernetesDriver::ToQuantity("64k"));
    EXPECT_EQ("1024", KubernetesDriver::ToQuantity("1024b"));
    EXPECT_EQ("", KubernetesDriver::ToQuantity(" "));
}

TEST(KubernetesDriverTest, PodManifestCarriesSpec) {
    KubernetesDriver driver("sandboxes");
    auto pod = driver.BuildPodManifest(MakeSpec());

    EXPECT_EQ("Pod", pod["kind"]);
    EXPECT_EQ("runtime-sandbox-container-abc123", pod["metadata"]["name"]);
    EXPECT_EQ("sandboxes", pod["metadata"]["namespace"]);
    EXPECT_EQ("base", pod["metadata"]["labels"]["sandpool.type"]);
    EXPECT_EQ("runtime-sandbox-container-abc123", pod["metadata"]["labels"]["app"]);
    EXPECT_EQ("Never", pod["spec"]["restartPolicy"]);

    const auto& container = pod["spec"]["containers"][0];
    EXPECT_EQ("agentscope/runtime-sandbox-base:latest", container["image"]);
    EXPECT_EQ(80, container["ports"][0]["containerPort"]);
    EXPECT_EQ("SECRET_TOKEN", container["env"][0]["name"]);
    EXPECT_EQ("2Gi", container["resources"]["limits"]["memory"]);
    EXPECT_EQ("1.5", container["resources"]["limits"]["cpu"]);
    EXPECT_EQ("/workspace", container["volumeMounts"][0]["mountPath"]);
    EXPECT_EQ("/srv/mounts/abc123", pod["spec"]["volumes"][0]["hostPath"]["path"]);
}

TEST(KubernetesDriverTest, ServiceManifestExposesNodePort) {
    KubernetesDriver driver("sandboxes");
    auto service = driver.BuildServiceManifest(MakeSpec());

    EXPECT_EQ("Service", service["kind"]);
    EXPECT_EQ("runtime-sandbox-container-abc123-service", service["metadata"]["name"]);
    EXPECT_EQ("NodePort", service["spec"]["type"]);
    EXPECT_EQ("runtime-sandbox-container-abc123", service["spec"]["selector"]["app"]);
    EXPECT_EQ(30123, service["spec"]["ports"][0]["nodePort"]);
    EXPECT_EQ(80, service["spec"]["ports"][0]["targetPort"]);
}

TEST(KubernetesDriverTest, ServiceWithoutHostPortLetsClusterChoose) {
    KubernetesDriver driver("default");
    auto spec = MakeSpec();
    spec.host_port = 0;
    auto service = driver.BuildServiceManifest(spec);
    EXPECT_FALSE(service["spec"]["ports"][0].contains("nodePort"));
}
