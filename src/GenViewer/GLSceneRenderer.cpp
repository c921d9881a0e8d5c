#include <GenViewer/GLSceneRenderer.hpp>
#include <GenViewer/SceneGraph.hpp>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <glm/gtc/type_ptr.hpp>
#include <plog/Log.h>
#include <tracy/Tracy.hpp>

namespace GenViewer {

namespace {

GLuint compileShader(GLenum type, const char* src){
    GLuint s = glCreateShader(type);
    glShaderSource(s,1,&src,nullptr);
    glCompileShader(s);
    GLint ok=0; glGetShaderiv(s,GL_COMPILE_STATUS,&ok);
    if(!ok){ char buf[1024]; glGetShaderInfoLog(s,1024,nullptr,buf); PLOGE << "gl:shader compile error: " << buf; glDeleteShader(s); return 0; }
    return s;
}

GLuint linkProgram(GLuint vs, GLuint fs){
    if(!vs || !fs) return 0;
    GLuint p = glCreateProgram(); glAttachShader(p,vs); glAttachShader(p,fs); glLinkProgram(p);
    GLint ok=0; glGetProgramiv(p,GL_LINK_STATUS,&ok);
    if(!ok){ char buf[1024]; glGetProgramInfoLog(p,1024,nullptr,buf); PLOGE << "gl:program link error: " << buf; glDeleteProgram(p); return 0; }
    return p;
}

// Position + normal; the only light is ambient so the normal is carried for
// completeness of the vertex layout and not used in the fragment stage.
const char* vs_src = R"(
#version 330 core
layout(location=0) in vec3 in_pos;
layout(location=1) in vec3 in_normal;
uniform mat4 uMVP;
out vec3 vNormal;
void main(){ vNormal = in_normal; gl_Position = uMVP * vec4(in_pos,1.0); }
)";

const char* fs_src = R"(
#version 330 core
in vec3 vNormal; out vec4 out_color;
uniform vec3 uAmbient; uniform vec3 uColor;
void main(){ out_color = vec4(uColor * uAmbient, 1.0); }
)";

} // namespace

struct GLSceneRenderer::Impl {
    GLuint prog = 0;
    GLuint vao = 0, vbo = 0, ibo = 0;
    GLsizei indexCount = 0;
    GLint locMVP = -1, locAmbient = -1, locColor = -1;
    // mesh currently resident in vbo/ibo; holding it keeps the pointer identity stable
    std::shared_ptr<const Mesh> uploaded;

    Impl(){
        GLuint vs = compileShader(GL_VERTEX_SHADER, vs_src);
        GLuint fs = compileShader(GL_FRAGMENT_SHADER, fs_src);
        prog = linkProgram(vs, fs);
        if(vs) glDeleteShader(vs);
        if(fs) glDeleteShader(fs);
        if(prog){
            locMVP = glGetUniformLocation(prog, "uMVP");
            locAmbient = glGetUniformLocation(prog, "uAmbient");
            locColor = glGetUniformLocation(prog, "uColor");
        }
        glGenVertexArrays(1, &vao);
        glGenBuffers(1, &vbo);
        glGenBuffers(1, &ibo);
    }
    ~Impl(){ if(prog) glDeleteProgram(prog); if(vbo) glDeleteBuffers(1,&vbo); if(ibo) glDeleteBuffers(1,&ibo); if(vao) glDeleteVertexArrays(1,&vao); }

    void upload(const std::shared_ptr<const Mesh>& mesh){
        ZoneScopedN("GLSceneRenderer::upload");
        std::vector<float> vbuf;
        vbuf.reserve(mesh->positions.size() * 6);
        for(size_t i=0;i<mesh->positions.size();++i){
            const glm::vec3& p = mesh->positions[i];
            glm::vec3 n = i < mesh->normals.size() ? mesh->normals[i] : glm::vec3(0.0f,0.0f,1.0f);
            vbuf.push_back(p.x); vbuf.push_back(p.y); vbuf.push_back(p.z);
            vbuf.push_back(n.x); vbuf.push_back(n.y); vbuf.push_back(n.z);
        }
        glBindVertexArray(vao);
        glBindBuffer(GL_ARRAY_BUFFER, vbo);
        glBufferData(GL_ARRAY_BUFFER, vbuf.size()*sizeof(float), vbuf.data(), GL_STATIC_DRAW);
        glEnableVertexAttribArray(0); glVertexAttribPointer(0,3,GL_FLOAT,GL_FALSE,6*sizeof(float),(void*)(0));
        glEnableVertexAttribArray(1); glVertexAttribPointer(1,3,GL_FLOAT,GL_FALSE,6*sizeof(float),(void*)(3*sizeof(float)));
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, mesh->indices.size()*sizeof(unsigned int), mesh->indices.data(), GL_STATIC_DRAW);
        glBindVertexArray(0);
        indexCount = static_cast<GLsizei>(mesh->indices.size());
        uploaded = mesh;
        PLOGI << "gl:uploaded mesh '" << mesh->name << "' vertices=" << mesh->vertexCount() << " indexCount=" << indexCount;
    }

    void release(){
        if(!uploaded) return;
        // orphan the old storage so the driver can reclaim it
        glBindBuffer(GL_ARRAY_BUFFER, vbo); glBufferData(GL_ARRAY_BUFFER, 0, nullptr, GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo); glBufferData(GL_ELEMENT_ARRAY_BUFFER, 0, nullptr, GL_STATIC_DRAW);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
        indexCount = 0;
        uploaded.reset();
        PLOGD << "gl:released mesh buffers";
    }
};

GLSceneRenderer::GLSceneRenderer(GLFWwindow* window) : impl_(std::make_unique<Impl>()), window_(window) {
    if(!impl_->prog) PLOGE << "gl:renderer created without a shader program; frames will be blank";
}

GLSceneRenderer::~GLSceneRenderer() = default;

bool GLSceneRenderer::isReady() const { return impl_ && impl_->prog != 0; }

void GLSceneRenderer::render(const SceneGraph& scene){
    ZoneScopedN("GLSceneRenderer::render");
    int w = scene.viewportWidth(), h = scene.viewportHeight();
    if(w <= 0 || h <= 0) glfwGetFramebufferSize(window_, &w, &h);
    glViewport(0, 0, w, h);
    glEnable(GL_DEPTH_TEST);
    glClearColor(clearColor_.r, clearColor_.g, clearColor_.b, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    const Pivot* pivot = scene.currentModel();
    if(!pivot || !pivot->mesh()){
        impl_->release();
        return; // camera + light only
    }
    if(impl_->uploaded != pivot->mesh()){
        impl_->release();
        impl_->upload(pivot->mesh());
    }
    if(!impl_->prog || impl_->indexCount == 0) return;

    const Camera& cam = scene.camera();
    glm::mat4 mvp = cam.projection() * cam.view() * pivot->meshMatrix();
    glUseProgram(impl_->prog);
    glUniformMatrix4fv(impl_->locMVP, 1, GL_FALSE, glm::value_ptr(mvp));
    glm::vec3 ambient = scene.ambientLight().radiance();
    glUniform3f(impl_->locAmbient, ambient.r, ambient.g, ambient.b);
    glUniform3f(impl_->locColor, baseColor_.r, baseColor_.g, baseColor_.b);
    glBindVertexArray(impl_->vao);
    glDrawElements(GL_TRIANGLES, impl_->indexCount, GL_UNSIGNED_INT, (void*)0);
    glBindVertexArray(0);
    glUseProgram(0);
}

void GLSceneRenderer::present(){
    glfwSwapBuffers(window_);
}

} // namespace GenViewer
